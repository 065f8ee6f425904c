// include/tempo_ngin/allocation/mean_variance.hpp
#pragma once

#include <Eigen/Dense>
#include "tempo_ngin/allocation/allocator.hpp"

namespace tempo_ngin {

/**
 * @brief Long-only mean-variance optimizer
 *
 * Maximizes mu'w - risk_aversion / 2 * w' Sigma w subject to
 * sum(w) = gross_target, 0 <= w_i <= cap_i and the group limits.
 * Solved by projected gradient ascent with a fixed step of
 * 1 / (risk_aversion * max eigenvalue) from the equal-weight point, so runs
 * are deterministic. Group limits are handled in the projection with
 * Dykstra's algorithm.
 *
 * A singular covariance or a solve that does not converge within
 * max_iterations is reported as SOLVER_ERROR.
 */
class MeanVarianceAllocator : public Allocator {
public:
    explicit MeanVarianceAllocator(AllocatorConfig config);

protected:
    Result<WeightVector> compute_raw_weights(const ReturnsWindow& window,
                                             const AllocationConstraints& constraints) const override;

private:
    /**
     * @brief Projection onto the feasible set
     */
    Result<WeightVector> project(const WeightVector& point,
                                 const AllocationConstraints& constraints) const;
};

}  // namespace tempo_ngin
