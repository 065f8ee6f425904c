#include "tempo_ngin/portfolio/vol_targeting.hpp"
#include <algorithm>
#include <cmath>
#include "tempo_ngin/core/logger.hpp"

namespace tempo_ngin {

Result<void> VolTargetingConfig::validate() const {
    if (!(target_vol > 0.0) || !std::isfinite(target_vol)) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "target_vol must be positive, got " + std::to_string(target_vol),
                                "VolTargetingConfig");
    }
    if (vol_lookback < 2) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "vol_lookback must be >= 2, got " + std::to_string(vol_lookback),
                                "VolTargetingConfig");
    }
    if (min_leverage < 0.0) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, "min_leverage must be >= 0",
                                "VolTargetingConfig");
    }
    if (!(max_leverage > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, "max_leverage must be positive",
                                "VolTargetingConfig");
    }
    if (min_leverage > max_leverage) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "min_leverage (" + std::to_string(min_leverage) +
                                    ") exceeds max_leverage (" + std::to_string(max_leverage) +
                                    ")",
                                "VolTargetingConfig");
    }
    return Result<void>();
}

nlohmann::json VolTargetingConfig::to_json() const {
    nlohmann::json j;
    j["target_vol"] = target_vol;
    j["vol_lookback"] = vol_lookback;
    j["min_leverage"] = min_leverage;
    j["max_leverage"] = max_leverage;
    j["version"] = version;
    return j;
}

void VolTargetingConfig::from_json(const nlohmann::json& j) {
    if (j.contains("target_vol"))
        target_vol = j.at("target_vol").get<double>();
    if (j.contains("vol_lookback"))
        vol_lookback = j.at("vol_lookback").get<size_t>();
    if (j.contains("min_leverage"))
        min_leverage = j.at("min_leverage").get<double>();
    if (j.contains("max_leverage"))
        max_leverage = j.at("max_leverage").get<double>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

VolTargetingOverlay::VolTargetingOverlay(VolTargetingConfig config)
    : config_(std::move(config)), returns_(config_.vol_lookback) {
    Logger::register_component("VolTargeting");
}

void VolTargetingOverlay::observe_return(double portfolio_return) {
    returns_.push(portfolio_return);
}

Result<double> VolTargetingOverlay::current_leverage() const {
    auto std_dev = returns_.std_dev();
    if (std_dev.is_error()) {
        return forward_error<double>(std_dev.error());
    }
    double realized = std_dev.value() * std::sqrt(ANNUALIZATION);
    if (!(realized > 0.0)) {
        return config_.max_leverage;
    }
    return std::clamp(config_.target_vol / realized, config_.min_leverage, config_.max_leverage);
}

Result<OverlayOutput> VolTargetingOverlay::apply(const WeightVector& target) const {
    OverlayOutput output;
    output.weights = target;
    if (!returns_.full()) {
        output.warming_up = true;
        return output;
    }

    auto leverage = current_leverage();
    if (leverage.is_error()) {
        return forward_error<OverlayOutput>(leverage.error());
    }
    output.leverage = leverage.value();
    for (double& w : output.weights) {
        w *= output.leverage;
    }
    return output;
}

}  // namespace tempo_ngin
