#pragma once

namespace tempo_ngin {
namespace transaction_cost {

/**
 * @brief Spread cost of portfolio turnover
 *
 * Each unit of turnover crosses half the quoted spread:
 *   cost = spread_cost_multiplier * spread_bps / 10000 * turnover
 */
class SpreadModel {
public:
    explicit SpreadModel(double spread_bps, double spread_cost_multiplier = 0.5);

    /**
     * @brief Spread cost as a fraction of portfolio value
     * @param turnover Sum of absolute target weight changes
     */
    double calculate_spread_cost(double turnover) const;

private:
    double spread_bps_;
    double spread_cost_multiplier_;
};

}  // namespace transaction_cost
}  // namespace tempo_ngin
