#include "tempo_ngin/transaction_cost/cost_model.hpp"
#include <cmath>

namespace tempo_ngin {
namespace transaction_cost {

namespace {

ImpactModel::Config impact_config(const CostPolicy& policy) {
    ImpactModel::Config config;
    config.k_bps = policy.impact_k_bps;
    config.participation_scale = policy.participation_scale;
    config.max_participation = policy.max_participation;
    return config;
}

Result<void> check_same_shape(const Frame& reference, const Frame& other,
                              const std::string& label) {
    if (other.index() != reference.index()) {
        auto diff = reference.index().difference(other.index());
        return make_error<void>(ErrorCode::ALIGNMENT_ERROR,
                                label + " index does not match target weights (" +
                                    std::to_string(diff.missing) + " missing, " +
                                    std::to_string(diff.extra) + " extra)",
                                "CostModel");
    }
    if (other.columns() != reference.columns()) {
        return make_error<void>(ErrorCode::ALIGNMENT_ERROR,
                                label + " columns do not match target weights", "CostModel");
    }
    return Result<void>();
}

}  // namespace

CostModel::CostModel(const CostPolicy& policy)
    : policy_(policy),
      spread_model_(policy.spread_bps),
      slippage_model_(policy.slippage_bps),
      impact_model_(impact_config(policy)) {}

double CostModel::turnover(const WeightVector& previous, const WeightVector& current) {
    double total = 0.0;
    for (size_t i = 0; i < current.size(); ++i) {
        double before = i < previous.size() ? previous[i] : 0.0;
        total += std::abs(current[i] - before);
    }
    return total;
}

Result<CostModelOutput> CostModel::apply(const WeightsHistory& weights,
                                         const Frame& returns) const {
    auto valid = policy_.validate();
    if (valid.is_error()) {
        return forward_error<CostModelOutput>(valid.error());
    }
    auto held_shape = check_same_shape(weights.target, weights.held, "Held weights");
    if (held_shape.is_error()) {
        return forward_error<CostModelOutput>(held_shape.error());
    }
    auto return_shape = check_same_shape(weights.target, returns, "Returns");
    if (return_shape.is_error()) {
        return forward_error<CostModelOutput>(return_shape.error());
    }

    const size_t n = weights.target.num_rows();
    CostModelOutput output;
    output.index = weights.target.index();
    output.gross.resize(n);
    output.net.resize(n);
    output.turnover.resize(n);
    output.costs.spread.resize(n);
    output.costs.slippage.resize(n);
    output.costs.impact.resize(n);

    WeightVector previous(weights.target.num_columns(), 0.0);
    for (size_t t = 0; t < n; ++t) {
        const auto& held = weights.held.row(t);
        const auto& r = returns.row(t);
        double gross = 0.0;
        for (size_t i = 0; i < held.size(); ++i) {
            gross += held[i] * r[i];
        }

        const auto& target = weights.target.row(t);
        double turnover_t = turnover(previous, target);
        previous = target;

        output.gross[t] = gross;
        output.turnover[t] = turnover_t;
        output.costs.spread[t] = spread_model_.calculate_spread_cost(turnover_t);
        output.costs.slippage[t] = slippage_model_.calculate_slippage_cost(turnover_t);
        output.costs.impact[t] = impact_model_.calculate_market_impact(turnover_t);
        output.net[t] = gross - output.costs.total_at(t);
    }

    return output;
}

Result<CostModelOutput> apply_costs(const WeightsHistory& weights, const Frame& returns,
                                    const CostPolicy& policy) {
    return CostModel(policy).apply(weights, returns);
}

}  // namespace transaction_cost
}  // namespace tempo_ngin
