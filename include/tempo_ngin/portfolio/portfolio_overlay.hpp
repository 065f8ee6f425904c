// include/tempo_ngin/portfolio/portfolio_overlay.hpp
#pragma once

#include <string>
#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/core/types.hpp"

namespace tempo_ngin {

/**
 * @brief Output of one overlay on one target row
 */
struct OverlayOutput {
    WeightVector weights;
    double leverage{1.0};     // Uniform scale the overlay applied to the row
    bool warming_up{false};   // Overlay passed the row through for lack of history
};

/**
 * @brief Post-allocation transformation of a target row
 *
 * Overlays receive and return weights over the same asset set, in the same
 * order. They only see portfolio returns that were handed to them through
 * observe_return, which the caller does after the step that realized them.
 */
class PortfolioOverlay {
public:
    virtual ~PortfolioOverlay() = default;

    virtual std::string name() const = 0;

    virtual Result<OverlayOutput> apply(const WeightVector& target) const = 0;

    /**
     * @brief Record the realized return of the portfolio this overlay shapes
     */
    virtual void observe_return(double /*portfolio_return*/) {}

    /**
     * @brief Portfolio returns needed before the overlay is fully active
     */
    virtual size_t warmup_period() const {
        return 0;
    }
};

}  // namespace tempo_ngin
