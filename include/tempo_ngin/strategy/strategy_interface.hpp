// include/tempo_ngin/strategy/strategy_interface.hpp
#pragma once

#include <string>
#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/core/types.hpp"
#include "tempo_ngin/data/market_data.hpp"
#include "tempo_ngin/execution/execution_module.hpp"

namespace tempo_ngin {

/**
 * @brief Interface for all intent-producing strategies
 *
 * A strategy only sees the MarketView it is handed; the view ends at the
 * decision timestamp.
 */
class StrategyInterface {
public:
    virtual ~StrategyInterface() = default;

    virtual const std::string& name() const = 0;
    virtual SignalType signal_type() const = 0;

    /**
     * @brief Observations needed before the first intent
     */
    virtual size_t warmup_period() const = 0;

    /**
     * @brief Refit on a training view that ends strictly before the next decision
     */
    virtual Result<void> train(const MarketView& view) = 0;

    /**
     * @brief Intent for view.as_of(), one value per symbol on a one-point index
     */
    virtual Result<Intent> generate_intent(const MarketView& view) = 0;
};

}  // namespace tempo_ngin
