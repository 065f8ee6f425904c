#include "tempo_ngin/portfolio/portfolio_constructor.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>
#include "tempo_ngin/allocation/weight_utils.hpp"

namespace tempo_ngin {

PortfolioConstructor::PortfolioConstructor(double gross_target, double per_asset_cap)
    : gross_target_(gross_target), per_asset_cap_(per_asset_cap) {}

Result<ConstructedTarget> PortfolioConstructor::construct(const WeightVector& exposures,
                                                          const WeightVector& allocation) const {
    if (exposures.size() != allocation.size()) {
        return make_error<ConstructedTarget>(
            ErrorCode::INVALID_ARGUMENT,
            "Exposure row has " + std::to_string(exposures.size()) +
                " assets, allocation row has " + std::to_string(allocation.size()),
            "PortfolioConstructor");
    }

    size_t active = 0;
    for (size_t i = 0; i < exposures.size(); ++i) {
        if (!std::isfinite(exposures[i]) || !std::isfinite(allocation[i])) {
            return make_error<ConstructedTarget>(ErrorCode::INVALID_DATA,
                                                 "Non-finite input for asset " + std::to_string(i),
                                                 "PortfolioConstructor");
        }
        if (exposures[i] != 0.0) {
            ++active;
        }
    }

    ConstructedTarget result;
    result.target.assign(exposures.size(), 0.0);
    result.signal.assign(exposures.size(), 0.0);
    if (active == 0) {
        return result;
    }

    std::vector<size_t> held;
    WeightVector magnitudes;
    for (size_t i = 0; i < exposures.size(); ++i) {
        if (exposures[i] == 0.0) {
            continue;
        }
        result.signal[i] = exposures[i] * gross_target_ / static_cast<double>(active);
        double product = std::abs(exposures[i] * allocation[i]);
        if (product > 0.0) {
            held.push_back(i);
            magnitudes.push_back(product);
        }
    }
    if (held.empty()) {
        return result;
    }

    // Fewer held assets than gross_target / cap leave every held asset at the cap
    double gross = std::min(gross_target_, per_asset_cap_ * static_cast<double>(held.size()));
    auto scaled = weights::cap_and_renormalize(
        magnitudes, WeightVector(held.size(), per_asset_cap_), gross);
    if (scaled.is_error()) {
        return forward_error<ConstructedTarget>(scaled.error());
    }
    for (size_t k = 0; k < held.size(); ++k) {
        result.target[held[k]] = std::copysign(scaled.value()[k], exposures[held[k]]);
    }
    return result;
}

}  // namespace tempo_ngin
