#include "tempo_ngin/transaction_cost/slippage_model.hpp"
#include <cmath>

namespace tempo_ngin {
namespace transaction_cost {

SlippageModel::SlippageModel(double slippage_bps) : slippage_bps_(slippage_bps) {}

double SlippageModel::calculate_slippage_cost(double turnover) const {
    return std::abs(turnover) * slippage_bps_ / 10000.0;
}

}  // namespace transaction_cost
}  // namespace tempo_ngin
