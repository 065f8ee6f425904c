#include "tempo_ngin/transaction_cost/spread_model.hpp"
#include <cmath>

namespace tempo_ngin {
namespace transaction_cost {

SpreadModel::SpreadModel(double spread_bps, double spread_cost_multiplier)
    : spread_bps_(spread_bps), spread_cost_multiplier_(spread_cost_multiplier) {}

double SpreadModel::calculate_spread_cost(double turnover) const {
    // turnover * spread_bps / 2 / 1e4 with the default multiplier
    return std::abs(turnover) * spread_bps_ * spread_cost_multiplier_ / 10000.0;
}

}  // namespace transaction_cost
}  // namespace tempo_ngin
