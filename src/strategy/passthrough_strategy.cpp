#include "tempo_ngin/strategy/passthrough_strategy.hpp"

namespace tempo_ngin {

PassthroughStrategy::PassthroughStrategy(std::string name, std::map<std::string, double> values,
                                         double default_value, SignalType signal_type)
    : BaseStrategy(std::move(name), signal_type, 0),
      values_(std::move(values)),
      default_value_(default_value) {}

Result<Intent> PassthroughStrategy::generate_intent(const MarketView& view) {
    std::vector<double> row;
    row.reserve(view.symbols().size());
    for (const auto& symbol : view.symbols()) {
        auto it = values_.find(symbol);
        row.push_back(it == values_.end() ? default_value_ : it->second);
    }
    return make_intent_row(view, row);
}

}  // namespace tempo_ngin
