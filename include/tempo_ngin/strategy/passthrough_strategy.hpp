// include/tempo_ngin/strategy/passthrough_strategy.hpp
#pragma once

#include <map>
#include <string>
#include "tempo_ngin/strategy/base_strategy.hpp"

namespace tempo_ngin {

/**
 * @brief Emits a constant intent per symbol, independent of prices
 *
 * Symbols without an explicit value get default_value (long by default).
 * Zero warmup.
 */
class PassthroughStrategy : public BaseStrategy {
public:
    explicit PassthroughStrategy(std::string name = "passthrough",
                                 std::map<std::string, double> values = {},
                                 double default_value = 1.0,
                                 SignalType signal_type = SignalType::DISCRETE);

    Result<Intent> generate_intent(const MarketView& view) override;

private:
    std::map<std::string, double> values_;
    double default_value_;
};

}  // namespace tempo_ngin
