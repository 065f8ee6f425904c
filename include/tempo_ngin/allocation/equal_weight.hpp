// include/tempo_ngin/allocation/equal_weight.hpp
#pragma once

#include "tempo_ngin/allocation/allocator.hpp"

namespace tempo_ngin {

/**
 * @brief Uniform weights, gross_target / N per asset
 *
 * Needs no history; the last link of every fallback chain.
 */
class EqualWeightAllocator : public Allocator {
public:
    explicit EqualWeightAllocator(AllocatorConfig config);

    size_t warmup_period() const override {
        return 0;
    }

protected:
    Result<WeightVector> compute_raw_weights(const ReturnsWindow& window,
                                             const AllocationConstraints& constraints) const override;
};

}  // namespace tempo_ngin
