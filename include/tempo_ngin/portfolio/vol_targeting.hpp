// include/tempo_ngin/portfolio/vol_targeting.hpp
#pragma once

#include <string>
#include "tempo_ngin/core/config_base.hpp"
#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/portfolio/portfolio_overlay.hpp"
#include "tempo_ngin/statistics/statistics_tools.hpp"

namespace tempo_ngin {

/**
 * @brief Configuration for portfolio volatility targeting
 */
struct VolTargetingConfig : public ConfigBase {
    double target_vol{0.10};  // Annualized
    size_t vol_lookback{60};  // Portfolio returns in the realized vol estimate
    double min_leverage{0.0};
    double max_leverage{2.0};

    std::string version{"1.0.0"};

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Scales the target row to a volatility target
 *
 * leverage = clamp(target_vol / (std(r) * sqrt(252)), min_leverage, max_leverage)
 * over the last vol_lookback observed portfolio returns. Until vol_lookback
 * returns were observed the leverage is 1.0 and the output is flagged as
 * warming up. A zero realized volatility gives max_leverage.
 */
class VolTargetingOverlay : public PortfolioOverlay {
public:
    static constexpr double ANNUALIZATION = 252.0;

    explicit VolTargetingOverlay(VolTargetingConfig config);

    std::string name() const override {
        return "vol_targeting";
    }

    Result<OverlayOutput> apply(const WeightVector& target) const override;

    void observe_return(double portfolio_return) override;

    size_t warmup_period() const override {
        return config_.vol_lookback;
    }

    /**
     * @brief Leverage the next apply() will use
     * @return INSUFFICIENT_HISTORY while warming up
     */
    Result<double> current_leverage() const;

    const VolTargetingConfig& config() const {
        return config_;
    }

private:
    VolTargetingConfig config_;
    statistics::RollingWindow returns_;
};

}  // namespace tempo_ngin
