#pragma once

#include <vector>
#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/core/frame.hpp"
#include "tempo_ngin/transaction_cost/cost_policy.hpp"
#include "tempo_ngin/transaction_cost/impact_model.hpp"
#include "tempo_ngin/transaction_cost/slippage_model.hpp"
#include "tempo_ngin/transaction_cost/spread_model.hpp"

namespace tempo_ngin {
namespace transaction_cost {

/**
 * @brief Target and held weights of a run on one index
 *
 * Held weights are produced by the execution delay; the cost model never
 * shifts anything itself.
 */
struct WeightsHistory {
    Frame target;
    Frame held;
};

/**
 * @brief Per-day cost breakdown, each component non-negative
 */
struct CostComponents {
    std::vector<double> spread;
    std::vector<double> slippage;
    std::vector<double> impact;

    /**
     * @brief Total cost of one day; the only summation order used for net returns
     */
    double total_at(size_t t) const {
        return spread[t] + slippage[t] + impact[t];
    }
};

/**
 * @brief Accounting of a run
 */
struct CostModelOutput {
    TimeIndex index;
    std::vector<double> gross;
    std::vector<double> net;
    std::vector<double> turnover;
    CostComponents costs;
};

/**
 * @brief Converts weights and returns into gross and net return series
 *
 * gross(t) = sum_i held_i(t) * r_i(t)
 * turnover(t) = sum_i |target_i(t) - target_i(t-1)|, target(-1) = 0
 * net(t) = gross(t) - (spread(t) + slippage(t) + impact(t))
 *
 * Costs are booked on the decision date of the turnover. A pure function of
 * its inputs.
 */
class CostModel {
public:
    explicit CostModel(const CostPolicy& policy);

    /**
     * @brief Account a full run
     * @param weights Target and held weights
     * @param returns Asset returns on the same index and columns
     * @return ALIGNMENT_ERROR when the frames disagree on index or columns
     */
    Result<CostModelOutput> apply(const WeightsHistory& weights, const Frame& returns) const;

    /**
     * @brief Turnover between two target rows
     */
    static double turnover(const WeightVector& previous, const WeightVector& current);

private:
    CostPolicy policy_;
    SpreadModel spread_model_;
    SlippageModel slippage_model_;
    ImpactModel impact_model_;
};

/**
 * @brief Convenience wrapper: CostModel(policy).apply(weights, returns)
 */
Result<CostModelOutput> apply_costs(const WeightsHistory& weights, const Frame& returns,
                                    const CostPolicy& policy);

}  // namespace transaction_cost
}  // namespace tempo_ngin
