#include "tempo_ngin/backtest/result_accumulator.hpp"
#include <cmath>
#include <memory>
#include "tempo_ngin/backtest/performance_calculator.hpp"
#include "tempo_ngin/core/logger.hpp"
#include "tempo_ngin/core/time_utils.hpp"
#include "tempo_ngin/transaction_cost/cost_model.hpp"

namespace tempo_ngin {

namespace {

double dot(const WeightVector& weights, const std::vector<double>& returns) {
    double total = 0.0;
    for (size_t i = 0; i < weights.size(); ++i) {
        total += weights[i] * returns[i];
    }
    return total;
}

std::vector<double> segment(const std::vector<double>& values, size_t begin) {
    return std::vector<double>(values.begin() + static_cast<std::ptrdiff_t>(begin), values.end());
}

}  // namespace

ResultAccumulator::ResultAccumulator(TimeIndex index, std::vector<std::string> symbols)
    : index_(std::move(index)), symbols_(std::move(symbols)) {
    Logger::register_component("ResultAccumulator");
    targets_.reserve(index_.size());
    held_.reserve(index_.size());
    pre_overlay_.reserve(index_.size());
    signal_.reserve(index_.size());
    leverage_.reserve(index_.size());
}

Result<void> ResultAccumulator::append(size_t position, StepRecord record) {
    if (finalized_) {
        return make_error<void>(ErrorCode::INVALID_STATE, "Result already finalized",
                                "ResultAccumulator");
    }
    if (position != targets_.size() || position >= index_.size()) {
        return make_error<void>(ErrorCode::INVALID_STATE,
                                "Step " + std::to_string(position) + " appended, expected " +
                                    std::to_string(targets_.size()),
                                "ResultAccumulator");
    }
    const size_t width = symbols_.size();
    if (record.target.size() != width || record.held.size() != width ||
        record.pre_overlay.size() != width || record.signal.size() != width) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Step " + std::to_string(position) + " rows must have " +
                                    std::to_string(width) + " assets",
                                "ResultAccumulator");
    }
    targets_.push_back(std::move(record.target));
    held_.push_back(std::move(record.held));
    pre_overlay_.push_back(std::move(record.pre_overlay));
    signal_.push_back(std::move(record.signal));
    leverage_.push_back(record.leverage);
    return Result<void>();
}

void ResultAccumulator::add_warning(std::string warning) {
    warnings_.push_back(std::move(warning));
}

Result<Frame> ResultAccumulator::to_frame(std::vector<WeightVector> rows) const {
    return Frame::create(index_, symbols_, std::move(rows));
}

Result<void> ResultAccumulator::check_single_shift(const ExecutionModule& execution,
                                                   const Frame& target,
                                                   const Frame& held) const {
    auto expected = execution.apply_delay(target);
    if (expected.is_error()) {
        return forward_error<void>(expected.error());
    }
    for (size_t t = 0; t < held.num_rows(); ++t) {
        if (held.row(t) != expected.value().row(t)) {
            return make_error<void>(ErrorCode::ATTRIBUTION_CONSERVATION_ERROR,
                                    "Held weights on " + core::format_date(index_[t]) +
                                        " are not the target delayed by " +
                                        std::to_string(execution.delay()) + " steps",
                                    "ResultAccumulator");
        }
    }
    return Result<void>();
}

Result<std::shared_ptr<const WalkforwardResult>> ResultAccumulator::finalize(
    const ExecutionModule& execution, const transaction_cost::CostPolicy& costs,
    const Frame& returns, const WarmupPlan& plan, size_t first_scored, nlohmann::json config) {
    using ResultPtr = std::shared_ptr<const WalkforwardResult>;
    if (finalized_) {
        return make_error<ResultPtr>(ErrorCode::INVALID_STATE, "Result already finalized",
                                     "ResultAccumulator");
    }
    if (targets_.size() != index_.size()) {
        return make_error<ResultPtr>(ErrorCode::INVALID_STATE,
                                     "Only " + std::to_string(targets_.size()) + " of " +
                                         std::to_string(index_.size()) + " steps recorded",
                                     "ResultAccumulator");
    }
    if (first_scored >= index_.size()) {
        return make_error<ResultPtr>(ErrorCode::INSUFFICIENT_WARMUP,
                                     "No steps left after the warmup", "ResultAccumulator");
    }
    finalized_ = true;

    auto target = to_frame(targets_);
    auto held = to_frame(held_);
    auto pre_overlay = to_frame(pre_overlay_);
    auto signal = to_frame(signal_);
    for (const auto* frame : {&target, &held, &pre_overlay, &signal}) {
        if (frame->is_error()) {
            return forward_error<ResultPtr>(frame->error());
        }
    }

    auto shift = check_single_shift(execution, target.value(), held.value());
    if (shift.is_error()) {
        return forward_error<ResultPtr>(shift.error());
    }

    transaction_cost::WeightsHistory history{target.value(), held.value()};
    auto accounting = transaction_cost::CostModel(costs).apply(history, returns);
    if (accounting.is_error()) {
        return forward_error<ResultPtr>(accounting.error());
    }

    auto delayed_pre = execution.apply_delay(pre_overlay.value());
    if (delayed_pre.is_error()) {
        return forward_error<ResultPtr>(delayed_pre.error());
    }
    auto delayed_signal = execution.apply_delay(signal.value());
    if (delayed_signal.is_error()) {
        return forward_error<ResultPtr>(delayed_signal.error());
    }

    auto result = std::make_shared<WalkforwardResult>(WalkforwardResult::PrivateTag{});
    result->accounting_ = accounting.take();
    const auto& gross = result->accounting_.gross;
    const auto& net = result->accounting_.net;
    const size_t n = index_.size();

    AttributionComponents& attribution = result->attribution_;
    attribution.signal.resize(n);
    attribution.allocation.resize(n);
    attribution.leverage.resize(n);
    for (size_t t = 0; t < n; ++t) {
        const auto& r = returns.row(t);
        const auto& s = delayed_signal.value().row(t);
        const auto& p = delayed_pre.value().row(t);
        const auto& h = held.value().row(t);
        WeightVector allocation_part(s.size());
        WeightVector leverage_part(s.size());
        for (size_t i = 0; i < s.size(); ++i) {
            allocation_part[i] = p[i] - s[i];
            leverage_part[i] = h[i] - p[i];
        }
        attribution.signal[t] = dot(s, r);
        attribution.allocation[t] = dot(allocation_part, r);
        attribution.leverage[t] = dot(leverage_part, r);

        double explained = attribution.signal[t] + attribution.allocation[t] +
                           attribution.leverage[t];
        double tolerance =
            CONSERVATION_ABS_TOLERANCE + CONSERVATION_REL_TOLERANCE * std::abs(gross[t]);
        if (!(std::abs(gross[t] - explained) <= tolerance)) {
            ERROR("Attribution does not reconcile on " << core::format_date(index_[t])
                                                       << ": gross " << gross[t]
                                                       << ", components " << explained);
            return make_error<ResultPtr>(ErrorCode::ATTRIBUTION_CONSERVATION_ERROR,
                                         "Attribution does not reconcile on " +
                                             core::format_date(index_[t]),
                                         "ResultAccumulator");
        }
        if (net[t] != gross[t] - result->accounting_.costs.total_at(t)) {
            return make_error<ResultPtr>(ErrorCode::ATTRIBUTION_CONSERVATION_ERROR,
                                         "Net return on " + core::format_date(index_[t]) +
                                             " is not gross minus costs",
                                         "ResultAccumulator");
        }
    }

    result->equity_curve_.resize(n);
    double equity = 1.0;
    for (size_t t = 0; t < n; ++t) {
        equity *= 1.0 + net[t];
        result->equity_curve_[t] = equity;
    }

    auto scored_index = index_.slice(first_scored, n);
    if (scored_index.is_error()) {
        return forward_error<ResultPtr>(scored_index.error());
    }
    PerformanceCalculator calculator;
    result->metrics_ =
        calculator.calculate(scored_index.value(), segment(net, first_scored),
                             segment(result->accounting_.turnover, first_scored),
                             segment(leverage_, first_scored));

    result->index_ = index_;
    result->target_weights_ = target.take();
    result->held_weights_ = held.take();
    result->leverage_ = std::move(leverage_);
    result->warmup_plan_ = plan;
    result->warnings_ = std::move(warnings_);
    result->config_ = std::move(config);

    INFO("Run accounted over " << n << " steps, " << result->warnings_.size() << " warnings");
    return ResultPtr(std::move(result));
}

}  // namespace tempo_ngin
