// include/tempo_ngin/portfolio/risk_caps.hpp
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "tempo_ngin/core/config_base.hpp"
#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/portfolio/portfolio_overlay.hpp"

namespace tempo_ngin {

/**
 * @brief Where the caps sit relative to volatility targeting
 */
enum class CapMode {
    BOTH,           // Before and after leverage
    PRE_LEVERAGE,   // Leverage may push weights past the caps
    POST_LEVERAGE   // Only the final row is capped
};

std::string cap_mode_to_string(CapMode mode);

/**
 * @brief Configuration for risk caps on target weights
 *
 * Caps are in the units of the target weights. Assets missing from
 * sector_map belong to the sector "Unknown".
 */
struct RiskCapsConfig : public ConfigBase {
    double max_weight_per_asset{0.25};        // Cap on |w_i|
    std::optional<double> max_sector_weight;  // Cap on sum |w_i| within a sector
    int min_assets_held{1};                   // Fewer active assets flatten the row
    std::map<std::string, std::string> sector_map;
    CapMode cap_mode{CapMode::BOTH};

    std::string version{"1.0.0"};

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Per-asset, per-sector and minimum-breadth limits
 *
 * Per-asset and sector caps redistribute the excess over the remaining active
 * assets with the same sign, preserving gross exposure while room is left.
 * A row with fewer than min_assets_held active assets is flattened.
 */
class RiskCapsOverlay : public PortfolioOverlay {
    struct PrivateTag {};

public:
    static constexpr int MAX_ITERATIONS = 100;

    /**
     * @return INVALID_CONFIG when the limits cannot be met for this universe
     */
    static Result<std::unique_ptr<RiskCapsOverlay>> create(RiskCapsConfig config,
                                                           std::vector<std::string> symbols);

    std::string name() const override {
        return "risk_caps";
    }

    Result<OverlayOutput> apply(const WeightVector& target) const override;

    const RiskCapsConfig& config() const {
        return config_;
    }

    // Use create(), which checks the limits against the universe
    RiskCapsOverlay(PrivateTag, RiskCapsConfig config, std::vector<std::string> symbols);

private:
    void cap_assets(WeightVector& w) const;
    bool cap_sectors(WeightVector& w) const;

    RiskCapsConfig config_;
    std::vector<std::string> symbols_;
    std::vector<size_t> sector_of_;  // Sector position per asset
    size_t num_sectors_{0};
};

}  // namespace tempo_ngin
