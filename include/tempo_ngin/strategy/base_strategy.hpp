// include/tempo_ngin/strategy/base_strategy.hpp
#pragma once

#include <string>
#include <vector>
#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/strategy/strategy_interface.hpp"

namespace tempo_ngin {

/**
 * @brief Base class for all strategies
 *
 * Holds the identity of a strategy and builds intent rows stamped with the
 * decision timestamp of a view.
 */
class BaseStrategy : public StrategyInterface {
public:
    BaseStrategy(std::string name, SignalType signal_type, size_t warmup_period);

    virtual ~BaseStrategy() = default;

    const std::string& name() const override {
        return name_;
    }

    SignalType signal_type() const override {
        return signal_type_;
    }

    size_t warmup_period() const override {
        return warmup_period_;
    }

    /**
     * @brief Default training is a no-op
     */
    Result<void> train(const MarketView& view) override;

    size_t times_trained() const {
        return times_trained_;
    }

protected:
    /**
     * @brief Intent of one value per symbol of the view, dated view.as_of()
     */
    Result<Intent> make_intent_row(const MarketView& view,
                                   const std::vector<double>& values) const;

    /**
     * @brief Fail with INSUFFICIENT_WARMUP when the view is shorter than the warmup
     */
    Result<void> check_warmup(const MarketView& view) const;

    size_t times_trained_{0};

private:
    std::string name_;
    SignalType signal_type_;
    size_t warmup_period_;
};

}  // namespace tempo_ngin
