#include "tempo_ngin/allocation/inverse_volatility.hpp"
#include <algorithm>
#include "tempo_ngin/allocation/weight_utils.hpp"
#include "tempo_ngin/statistics/statistics_tools.hpp"

namespace tempo_ngin {

InverseVolatilityAllocator::InverseVolatilityAllocator(AllocatorConfig config)
    : Allocator(AllocatorType::INVERSE_VOLATILITY, std::move(config)) {}

Result<WeightVector> InverseVolatilityAllocator::compute_raw_weights(
    const ReturnsWindow& window, const AllocationConstraints& constraints) const {
    auto data = statistics::to_matrix(window.rows);
    if (data.is_error()) {
        return forward_error<WeightVector>(data.error());
    }
    auto vol = statistics::sample_volatility(data.value(), 2);
    if (vol.is_error()) {
        return forward_error<WeightVector>(vol.error());
    }

    WeightVector raw(constraints.caps.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        raw[i] = 1.0 / std::max(vol.value()(static_cast<Eigen::Index>(i)), config().min_vol);
    }
    return weights::cap_and_renormalize(raw, constraints.caps, constraints.gross_target);
}

}  // namespace tempo_ngin
