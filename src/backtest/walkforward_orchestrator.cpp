#include "tempo_ngin/backtest/walkforward_orchestrator.hpp"
#include <algorithm>
#include <future>
#include <set>
#include "tempo_ngin/core/logger.hpp"
#include "tempo_ngin/core/time_utils.hpp"
#include "tempo_ngin/portfolio/risk_caps.hpp"
#include "tempo_ngin/portfolio/vol_targeting.hpp"

namespace tempo_ngin {

namespace {

double dot(const WeightVector& weights, const std::vector<double>& returns) {
    double total = 0.0;
    for (size_t i = 0; i < weights.size(); ++i) {
        total += weights[i] * returns[i];
    }
    return total;
}

}  // namespace

WalkforwardOrchestrator::WalkforwardOrchestrator(
    WalkforwardConfig config, std::shared_ptr<const MarketData> data,
    std::vector<std::unique_ptr<StrategyInterface>> strategies)
    : config_(std::move(config)), data_(std::move(data)) {
    Logger::register_component("WalkforwardOrchestrator");
    for (auto& strategy : strategies) {
        StrategySlot slot;
        slot.strategy = std::move(strategy);
        slots_.push_back(std::move(slot));
    }
}

template <typename T>
Result<T> WalkforwardOrchestrator::fail(const TempoError* error) {
    ERROR("Walk-forward run failed: " << error->to_string());
    auto failed = state_.fail(error->to_string());
    if (failed.is_error()) {
        WARN(failed.error()->what());
    }
    return forward_error<T>(error);
}

Result<void> WalkforwardOrchestrator::initialize() {
    if (initialized_) {
        return make_error<void>(ErrorCode::INVALID_STATE, "Orchestrator already initialized",
                                "WalkforwardOrchestrator");
    }
    auto built = build_layers();
    if (built.is_error()) {
        return fail<void>(built.error());
    }
    initialized_ = true;
    INFO("Walk-forward run initialized: " << data_->symbols().size() << " assets, "
                                          << data_->index().size() << " steps, "
                                          << slots_.size() << " strategies");
    return Result<void>();
}

Result<void> WalkforwardOrchestrator::build_layers() {
    if (!data_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "No market data",
                                "WalkforwardOrchestrator");
    }
    if (slots_.empty()) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, "No strategies configured",
                                "WalkforwardOrchestrator");
    }
    std::set<std::string> names;
    std::vector<std::string> strategy_names;
    for (const auto& slot : slots_) {
        if (!slot.strategy) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Null strategy",
                                    "WalkforwardOrchestrator");
        }
        if (!names.insert(slot.strategy->name()).second) {
            return make_error<void>(ErrorCode::INVALID_CONFIG,
                                    "Duplicate strategy name '" + slot.strategy->name() + "'",
                                    "WalkforwardOrchestrator");
        }
        strategy_names.push_back(slot.strategy->name());
    }

    auto valid = config_.validate();
    if (valid.is_error()) {
        return valid;
    }
    const auto& symbols = data_->symbols();
    auto universe = config_.validate_universe(symbols);
    if (universe.is_error()) {
        return universe;
    }

    auto policy = make_execution_policy(config_.execution);
    if (policy.is_error()) {
        return forward_error<void>(policy.error());
    }
    execution_ = std::make_unique<ExecutionModule>(policy.value());
    returns_ = compute_asset_returns(*data_, policy.value()->price_used);
    exposure_mapper_ = std::make_unique<ExposureMapper>(config_.exposure);

    auto allocator = registry_.create(config_.allocator);
    if (allocator.is_error()) {
        return forward_error<void>(allocator.error());
    }
    allocator_ = allocator.value();
    auto constraints = AllocationConstraints::from_config(config_.allocator, symbols);
    if (constraints.is_error()) {
        return forward_error<void>(constraints.error());
    }
    constraints_ = constraints.take();
    constructor_ = std::make_unique<PortfolioConstructor>(config_.allocator.gross_exposure_cap,
                                                          config_.allocator.per_asset_cap);

    auto meta = make_meta_combiner(config_.meta, strategy_names, *execution_);
    if (meta.is_error()) {
        return forward_error<void>(meta.error());
    }
    meta_ = meta.take();

    // Caps before leverage, vol targeting, caps again on the levered row
    const bool levered = config_.vol_targeting.has_value();
    const CapMode cap_mode = config_.risk_caps ? config_.risk_caps->cap_mode : CapMode::BOTH;
    auto add_caps = [&]() -> Result<void> {
        auto caps = RiskCapsOverlay::create(*config_.risk_caps, symbols);
        if (caps.is_error()) {
            return forward_error<void>(caps.error());
        }
        overlays_.push_back(caps.take());
        return Result<void>();
    };
    if (config_.risk_caps && (!levered || cap_mode != CapMode::POST_LEVERAGE)) {
        auto added = add_caps();
        if (added.is_error()) {
            return added;
        }
    }
    size_t vol_lookback = 0;
    if (levered) {
        overlays_.push_back(std::make_unique<VolTargetingOverlay>(*config_.vol_targeting));
        vol_lookback = overlays_.back()->warmup_period();
        if (config_.risk_caps && cap_mode != CapMode::PRE_LEVERAGE) {
            auto added = add_caps();
            if (added.is_error()) {
                return added;
            }
        }
    }

    LayerWarmups layers;
    for (const auto& slot : slots_) {
        layers.strategy = std::max(layers.strategy, slot.strategy->warmup_period());
    }
    layers.meta = meta_->warmup_period();
    layers.allocator = allocator_->warmup_period();
    plan_ = WarmupResolver::compute(layers, execution_->delay(), vol_lookback);
    INFO("Warmup plan: " << plan_.description);

    const TimeIndex& index = data_->index();
    auto covered = WarmupResolver::require(plan_, index.size());
    if (covered.is_error()) {
        return covered;
    }

    auto strategy_schedule =
        ScheduleResolver::resolve(config_.strategy_schedule, index, plan_.strategy_warmup);
    if (strategy_schedule.is_error()) {
        return forward_error<void>(strategy_schedule.error());
    }
    strategy_schedule_ = strategy_schedule.take();
    auto meta_schedule =
        ScheduleResolver::resolve(config_.meta_schedule, index, plan_.parallel_warmup);
    if (meta_schedule.is_error()) {
        return forward_error<void>(meta_schedule.error());
    }
    meta_schedule_ = meta_schedule.take();
    auto allocation_schedule =
        ScheduleResolver::resolve(config_.allocation_schedule, index, plan_.parallel_warmup);
    if (allocation_schedule.is_error()) {
        return forward_error<void>(allocation_schedule.error());
    }
    allocation_schedule_ = allocation_schedule.take();

    for (auto& slot : slots_) {
        slot.history.assign(index.size(), WeightVector(symbols.size(), 0.0));
    }
    return Result<void>();
}

Result<Intent> WalkforwardOrchestrator::run_strategy(StrategySlot& slot, size_t t) {
    bool retrain = t >= 1 && (!slot.trained || strategy_schedule_.is_scheduled(t));
    if (retrain) {
        size_t window = std::min(config_.train_window, t);
        auto train_view = MarketView::create(data_, t - window, t - 1);
        if (train_view.is_error()) {
            return forward_error<Intent>(train_view.error());
        }
        auto trained = slot.strategy->train(train_view.value());
        if (trained.is_error()) {
            return forward_error<Intent>(trained.error());
        }
        slot.trained = true;
    }

    auto view = MarketView::create(data_, 0, t);
    if (view.is_error()) {
        return forward_error<Intent>(view.error());
    }
    return slot.strategy->generate_intent(view.value());
}

Result<void> WalkforwardOrchestrator::check_intent(const StrategySlot& slot, const Intent& intent,
                                                   size_t t) const {
    auto valid = execution_->validate_intent(intent, slot.strategy->signal_type());
    if (valid.is_error()) {
        return valid;
    }

    auto reference = data_->index().slice(t, t + 1);
    if (reference.is_error()) {
        return forward_error<void>(reference.error());
    }
    std::vector<TimeIndex> indices;
    indices.reserve(intent.size());
    for (const auto& entry : intent) {
        indices.push_back(entry.second.index);
    }
    auto aligned = execution_->validate_alignment_all(reference.value(), indices);
    if (aligned.is_error()) {
        return make_error<void>(aligned.error()->code(),
                                "Strategy " + slot.strategy->name() + ": " +
                                    aligned.error()->what(),
                                "WalkforwardOrchestrator");
    }

    const auto& symbols = data_->symbols();
    if (intent.size() != symbols.size()) {
        return make_error<void>(ErrorCode::INTENT_VALIDATION_ERROR,
                                "Strategy " + slot.strategy->name() + " returned " +
                                    std::to_string(intent.size()) + " assets, universe has " +
                                    std::to_string(symbols.size()),
                                "WalkforwardOrchestrator");
    }
    for (const auto& symbol : symbols) {
        if (intent.find(symbol) == intent.end()) {
            return make_error<void>(ErrorCode::INTENT_VALIDATION_ERROR,
                                    "Strategy " + slot.strategy->name() + " has no intent for '" +
                                        symbol + "'",
                                    "WalkforwardOrchestrator");
        }
    }
    return Result<void>();
}

Result<void> WalkforwardOrchestrator::collect_intents(size_t t) {
    std::vector<size_t> active;
    std::vector<std::future<Result<Intent>>> pending;
    for (size_t k = 0; k < slots_.size(); ++k) {
        if (slots_[k].strategy->warmup_period() > t) {
            continue;
        }
        active.push_back(k);
        StrategySlot* slot = &slots_[k];
        std::string date = core::format_date(data_->index()[t]);
        pending.push_back(std::async(std::launch::async, [this, slot, t, date]() {
            Logger::register_component("Strategy " + slot->strategy->name());
            StepLogContext step_context(date);
            return run_strategy(*slot, t);
        }));
    }

    // Single synchronization point: every worker is joined before any result is used
    std::vector<Result<Intent>> intents;
    intents.reserve(pending.size());
    for (auto& future : pending) {
        intents.push_back(future.get());
    }

    const auto& symbols = data_->symbols();
    for (size_t j = 0; j < active.size(); ++j) {
        StrategySlot& slot = slots_[active[j]];
        if (intents[j].is_error()) {
            return make_error<void>(intents[j].error()->code(),
                                    "Strategy " + slot.strategy->name() + " failed at " +
                                        core::format_date(data_->index()[t]) + ": " +
                                        intents[j].error()->what(),
                                    "WalkforwardOrchestrator");
        }
        const Intent& intent = intents[j].value();
        auto checked = check_intent(slot, intent, t);
        if (checked.is_error()) {
            return checked;
        }
        WeightVector row(symbols.size());
        for (size_t i = 0; i < symbols.size(); ++i) {
            row[i] = intent.at(symbols[i]).values.front();
        }
        slot.history[t] = std::move(row);
    }
    return Result<void>();
}

Result<MetaWindow> WalkforwardOrchestrator::build_meta_window(size_t t) const {
    MetaWindow window;
    window.as_of = data_->index()[t];
    const size_t lookback = meta_->warmup_period();
    if (lookback == 0) {
        return window;
    }

    const size_t begin = t - lookback;
    auto index = data_->index().slice(begin, t);
    if (index.is_error()) {
        return forward_error<MetaWindow>(index.error());
    }
    auto returns = returns_.slice(begin, t);
    if (returns.is_error()) {
        return forward_error<MetaWindow>(returns.error());
    }
    window.raw_returns = returns.value().to_series();

    const auto& symbols = data_->symbols();
    for (const auto& slot : slots_) {
        Intent intent;
        for (size_t i = 0; i < symbols.size(); ++i) {
            std::vector<double> values;
            values.reserve(lookback);
            for (size_t s = begin; s < t; ++s) {
                values.push_back(slot.history[s][i]);
            }
            auto series = Series::create(index.value(), std::move(values));
            if (series.is_error()) {
                return forward_error<MetaWindow>(series.error());
            }
            intent.emplace(symbols[i], series.take());
        }
        window.intents.emplace(slot.strategy->name(), std::move(intent));
    }
    return window;
}

Result<void> WalkforwardOrchestrator::refresh_meta_weights(size_t t) {
    if (meta_weights_ && !meta_schedule_.is_scheduled(t)) {
        return Result<void>();
    }
    auto window = build_meta_window(t);
    if (window.is_error()) {
        return forward_error<void>(window.error());
    }
    auto weights = meta_->compute_weights(window.value());
    if (weights.is_error()) {
        return forward_error<void>(weights.error());
    }
    meta_weights_ = weights.take();
    return Result<void>();
}

Result<void> WalkforwardOrchestrator::refresh_allocation(size_t t) {
    if (allocation_ && !allocation_schedule_.is_scheduled(t)) {
        return Result<void>();
    }

    // Row 0 of the returns frame has no prior price and is never used
    const size_t lookback = config_.allocator.lookback;
    ReturnsWindow window;
    window.as_of = data_->index()[t];
    if (t >= 1) {
        size_t begin = t > lookback ? t - lookback : 1;
        for (size_t s = begin; s < t; ++s) {
            window.timestamps.push_back(data_->index()[s]);
            window.rows.push_back(returns_.row(s));
        }
    }

    auto allocation = allocator_->compute_weights(window, constraints_);
    if (allocation.is_error()) {
        return forward_error<void>(allocation.error());
    }
    AllocationResult result = allocation.take();
    for (const auto& warning : result.warnings) {
        accumulator_->add_warning(core::format_date(window.as_of) + ": " + warning);
    }
    allocation_ = std::move(result.weights);
    return Result<void>();
}

Result<WalkforwardOrchestrator::StepDecision> WalkforwardOrchestrator::decide(size_t t) {
    const size_t n = data_->symbols().size();
    StepDecision decision;
    decision.record.target.assign(n, 0.0);
    decision.record.pre_overlay.assign(n, 0.0);
    decision.record.signal.assign(n, 0.0);
    decision.overlay_inputs.assign(overlays_.size(), WeightVector(n, 0.0));
    if (t < plan_.parallel_warmup) {
        return decision;
    }

    auto meta = refresh_meta_weights(t);
    if (meta.is_error()) {
        return forward_error<StepDecision>(meta.error());
    }
    std::map<std::string, WeightVector> rows;
    for (const auto& slot : slots_) {
        rows[slot.strategy->name()] = slot.history[t];
    }
    auto combined = MetaCombiner::combine(*meta_weights_, rows);
    if (combined.is_error()) {
        return forward_error<StepDecision>(combined.error());
    }
    auto exposures = exposure_mapper_->map(combined.value());
    if (exposures.is_error()) {
        return forward_error<StepDecision>(exposures.error());
    }

    auto allocated = refresh_allocation(t);
    if (allocated.is_error()) {
        return forward_error<StepDecision>(allocated.error());
    }
    auto constructed = constructor_->construct(exposures.value(), *allocation_);
    if (constructed.is_error()) {
        return forward_error<StepDecision>(constructed.error());
    }
    decision.record.pre_overlay = constructed.value().target;
    decision.record.signal = constructed.value().signal;

    WeightVector current = decision.record.pre_overlay;
    for (size_t k = 0; k < overlays_.size(); ++k) {
        decision.overlay_inputs[k] = current;
        auto output = overlays_[k]->apply(current);
        if (output.is_error()) {
            return forward_error<StepDecision>(output.error());
        }
        decision.record.leverage *= output.value().leverage;
        current = output.value().weights;
    }
    decision.record.target = std::move(current);
    return decision;
}

Result<std::shared_ptr<const WalkforwardResult>> WalkforwardOrchestrator::run() {
    using ResultPtr = std::shared_ptr<const WalkforwardResult>;
    if (!initialized_) {
        return make_error<ResultPtr>(ErrorCode::NOT_INITIALIZED,
                                     "initialize() must succeed before run()",
                                     "WalkforwardOrchestrator");
    }
    auto warming = state_.transition(RunState::WARMING_UP);
    if (warming.is_error()) {
        return forward_error<ResultPtr>(warming.error());
    }

    const TimeIndex& index = data_->index();
    const auto& symbols = data_->symbols();
    const size_t live_from = plan_.parallel_warmup + static_cast<size_t>(execution_->delay());
    INFO("Walk-forward run " << core::format_date(index.front()) << " to "
                             << core::format_date(index.back()) << ", first target at step "
                             << plan_.parallel_warmup);

    accumulator_ = std::make_unique<ResultAccumulator>(index, symbols);
    DelayLine held_line = execution_->make_delay_line(symbols.size());
    std::vector<DelayLine> overlay_lines;
    for (size_t k = 0; k < overlays_.size(); ++k) {
        overlay_lines.push_back(execution_->make_delay_line(symbols.size()));
    }

    for (size_t t = 0; t < index.size(); ++t) {
        StepLogContext step_context(core::format_date(index[t]));
        if (t == plan_.parallel_warmup) {
            auto stepping = state_.transition(RunState::STEPPING);
            if (stepping.is_error()) {
                return fail<ResultPtr>(stepping.error());
            }
        }

        auto collected = collect_intents(t);
        if (collected.is_error()) {
            return fail<ResultPtr>(collected.error());
        }
        auto decision = decide(t);
        if (decision.is_error()) {
            return fail<ResultPtr>(decision.error());
        }
        StepDecision step = decision.take();

        auto held = held_line.push(step.record.target);
        if (held.is_error()) {
            return fail<ResultPtr>(held.error());
        }
        step.record.held = held.take();

        for (size_t k = 0; k < overlays_.size(); ++k) {
            auto overlay_held = overlay_lines[k].push(step.overlay_inputs[k]);
            if (overlay_held.is_error()) {
                return fail<ResultPtr>(overlay_held.error());
            }
            if (t >= live_from) {
                overlays_[k]->observe_return(dot(overlay_held.value(), returns_.row(t)));
            }
        }

        auto appended = accumulator_->append(t, std::move(step.record));
        if (appended.is_error()) {
            return fail<ResultPtr>(appended.error());
        }
    }

    auto finalizing = state_.transition(RunState::FINALIZING);
    if (finalizing.is_error()) {
        return fail<ResultPtr>(finalizing.error());
    }
    auto result = accumulator_->finalize(*execution_, config_.costs, returns_, plan_,
                                         plan_.total_warmup, config_.to_json());
    if (result.is_error()) {
        return fail<ResultPtr>(result.error());
    }
    auto complete = state_.transition(RunState::COMPLETE);
    if (complete.is_error()) {
        return fail<ResultPtr>(complete.error());
    }

    const auto& metrics = result.value()->metrics();
    INFO("Walk-forward run complete: total return " << metrics.total_return << ", Sharpe "
                                                    << metrics.sharpe_ratio << ", max drawdown "
                                                    << metrics.max_drawdown);
    return result;
}

}  // namespace tempo_ngin
