// include/tempo_ngin/allocation/weight_utils.hpp
#pragma once

#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/core/types.hpp"

namespace tempo_ngin {
namespace weights {

/**
 * @brief Euclidean projection onto {w : sum(w) = total, 0 <= w_i <= cap_i}
 *
 * Finds the shift tau with sum(clamp(v_i - tau, 0, cap_i)) = total by
 * bisection.
 * @return SOLVER_ERROR when sum(caps) < total
 */
Result<WeightVector> project_capped_simplex(const WeightVector& point, const WeightVector& caps,
                                            double total);

/**
 * @brief Scale non-negative raw weights to a total, capping and redistributing
 *
 * Weights above their cap are fixed at the cap and the excess is spread over
 * the remaining assets in proportion to their raw weights, until no weight
 * exceeds its cap.
 * @return SOLVER_ERROR when the caps cannot absorb the total
 */
Result<WeightVector> cap_and_renormalize(const WeightVector& raw, const WeightVector& caps,
                                         double total);

double sum(const WeightVector& weights);

double gross(const WeightVector& weights);

}  // namespace weights
}  // namespace tempo_ngin
