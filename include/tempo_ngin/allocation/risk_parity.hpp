// include/tempo_ngin/allocation/risk_parity.hpp
#pragma once

#include "tempo_ngin/allocation/allocator.hpp"

namespace tempo_ngin {

/**
 * @brief Equal risk contribution weights
 *
 * One or two assets use the closed form (inverse volatility). Three or more
 * assets use cyclical coordinate descent on the ERC conditions; a solve that
 * does not converge within max_iterations is reported as SOLVER_ERROR.
 */
class RiskParityAllocator : public Allocator {
public:
    explicit RiskParityAllocator(AllocatorConfig config);

protected:
    Result<WeightVector> compute_raw_weights(const ReturnsWindow& window,
                                             const AllocationConstraints& constraints) const override;
};

}  // namespace tempo_ngin
