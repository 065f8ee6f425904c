#include "tempo_ngin/strategy/base_strategy.hpp"
#include "tempo_ngin/core/logger.hpp"
#include "tempo_ngin/schedule/warmup_resolver.hpp"

namespace tempo_ngin {

BaseStrategy::BaseStrategy(std::string name, SignalType signal_type, size_t warmup_period)
    : name_(std::move(name)), signal_type_(signal_type), warmup_period_(warmup_period) {
    Logger::register_component("Strategy");
}

Result<void> BaseStrategy::train(const MarketView&) {
    ++times_trained_;
    return Result<void>();
}

Result<void> BaseStrategy::check_warmup(const MarketView& view) const {
    // The view holds positions [begin, as_of]; as_of itself is the decision row
    return WarmupResolver::require_layer("strategy " + name_, view.size() - 1, warmup_period_);
}

Result<Intent> BaseStrategy::make_intent_row(const MarketView& view,
                                             const std::vector<double>& values) const {
    const auto& symbols = view.symbols();
    if (values.size() != symbols.size()) {
        return make_error<Intent>(ErrorCode::STRATEGY_ERROR,
                                  "Strategy " + name_ + " produced " +
                                      std::to_string(values.size()) + " values for " +
                                      std::to_string(symbols.size()) + " symbols",
                                  "BaseStrategy");
    }

    auto full = view.index();
    auto point = full.slice(full.size() - 1, full.size());
    if (point.is_error()) {
        return forward_error<Intent>(point.error());
    }

    Intent intent;
    for (size_t i = 0; i < symbols.size(); ++i) {
        auto series = Series::create(point.value(), {values[i]});
        if (series.is_error()) {
            return forward_error<Intent>(series.error());
        }
        intent.emplace(symbols[i], series.take());
    }
    return intent;
}

}  // namespace tempo_ngin
