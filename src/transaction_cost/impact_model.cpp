#include "tempo_ngin/transaction_cost/impact_model.hpp"

#include <algorithm>
#include <cmath>

namespace tempo_ngin {
namespace transaction_cost {

ImpactModel::ImpactModel(const Config& config) : config_(config) {}

double ImpactModel::participation(double turnover) const {
    double rate = std::abs(turnover) / config_.participation_scale;
    return std::clamp(rate, config_.min_participation, config_.max_participation);
}

double ImpactModel::calculate_market_impact(double turnover) const {
    turnover = std::abs(turnover);

    // Square-root impact model: impact_bps = k * sqrt(participation)
    double impact_bps = config_.k_bps * std::sqrt(participation(turnover));

    return turnover * impact_bps / 10000.0;
}

}  // namespace transaction_cost
}  // namespace tempo_ngin
