#include "tempo_ngin/allocation/equal_weight.hpp"

namespace tempo_ngin {

EqualWeightAllocator::EqualWeightAllocator(AllocatorConfig config)
    : Allocator(AllocatorType::EQUAL_WEIGHT, std::move(config)) {}

Result<WeightVector> EqualWeightAllocator::compute_raw_weights(
    const ReturnsWindow&, const AllocationConstraints& constraints) const {
    const size_t n = constraints.caps.size();
    if (n == 0) {
        return make_error<WeightVector>(ErrorCode::INVALID_ARGUMENT, "Empty universe",
                                        "EqualWeightAllocator");
    }
    return WeightVector(n, constraints.gross_target / static_cast<double>(n));
}

}  // namespace tempo_ngin
