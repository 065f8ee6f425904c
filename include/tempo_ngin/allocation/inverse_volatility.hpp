// include/tempo_ngin/allocation/inverse_volatility.hpp
#pragma once

#include "tempo_ngin/allocation/allocator.hpp"

namespace tempo_ngin {

/**
 * @brief Weights proportional to 1 / trailing volatility
 *
 * Sample volatility over the window, floored at min_vol, then scaled to the
 * gross target with capped renormalization.
 */
class InverseVolatilityAllocator : public Allocator {
public:
    explicit InverseVolatilityAllocator(AllocatorConfig config);

protected:
    Result<WeightVector> compute_raw_weights(const ReturnsWindow& window,
                                             const AllocationConstraints& constraints) const override;
};

}  // namespace tempo_ngin
