// include/tempo_ngin/portfolio/portfolio_constructor.hpp
#pragma once

#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/core/types.hpp"

namespace tempo_ngin {

/**
 * @brief Target row before overlays, with its equal-risk reference
 */
struct ConstructedTarget {
    WeightVector target;  // Exposure times allocation, scaled to the gross target under the cap
    WeightVector signal;  // Exposure spread evenly over active assets
};

/**
 * @brief Combines signed exposures with long-only allocation weights
 *
 * For the active assets A = {i : e_i != 0}, the magnitudes |e_i * a_i| are
 * scaled to sum to G, assets above the per-asset cap are held at the cap and
 * the excess is spread over the others in proportion. target_i carries the
 * sign of e_i. When the held assets cannot absorb G under the cap, each sits
 * at the cap.
 *   signal_i = e_i * G / |A|
 * No active asset, or no allocation on the active assets, gives a zero row.
 */
class PortfolioConstructor {
public:
    PortfolioConstructor(double gross_target, double per_asset_cap);

    Result<ConstructedTarget> construct(const WeightVector& exposures,
                                        const WeightVector& allocation) const;

    double gross_target() const {
        return gross_target_;
    }

    double per_asset_cap() const {
        return per_asset_cap_;
    }

private:
    double gross_target_;
    double per_asset_cap_;
};

}  // namespace tempo_ngin
