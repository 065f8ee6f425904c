#pragma once

namespace tempo_ngin {
namespace transaction_cost {

/**
 * @brief Linear slippage: slippage_bps / 10000 per unit of turnover
 */
class SlippageModel {
public:
    explicit SlippageModel(double slippage_bps);

    double calculate_slippage_cost(double turnover) const;

private:
    double slippage_bps_;
};

}  // namespace transaction_cost
}  // namespace tempo_ngin
