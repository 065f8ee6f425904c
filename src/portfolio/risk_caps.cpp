#include "tempo_ngin/portfolio/risk_caps.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include "tempo_ngin/core/logger.hpp"

namespace tempo_ngin {

namespace {

constexpr double ACTIVE_EPSILON = 1e-12;

double gross_of(const WeightVector& w) {
    double total = 0.0;
    for (double v : w) {
        total += std::abs(v);
    }
    return total;
}

}  // namespace

std::string cap_mode_to_string(CapMode mode) {
    switch (mode) {
        case CapMode::BOTH:
            return "both";
        case CapMode::PRE_LEVERAGE:
            return "pre_leverage";
        case CapMode::POST_LEVERAGE:
            return "post_leverage";
        default:
            return "unknown";
    }
}

Result<void> RiskCapsConfig::validate() const {
    if (!(max_weight_per_asset > 0.0) || max_weight_per_asset > 1.0) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "max_weight_per_asset must be in (0, 1], got " +
                                    std::to_string(max_weight_per_asset),
                                "RiskCapsConfig");
    }
    if (max_sector_weight && (!(*max_sector_weight > 0.0) || *max_sector_weight > 1.0)) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "max_sector_weight must be in (0, 1], got " +
                                    std::to_string(*max_sector_weight),
                                "RiskCapsConfig");
    }
    if (min_assets_held < 1) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "min_assets_held must be >= 1, got " +
                                    std::to_string(min_assets_held),
                                "RiskCapsConfig");
    }
    return Result<void>();
}

nlohmann::json RiskCapsConfig::to_json() const {
    nlohmann::json j;
    j["max_weight_per_asset"] = max_weight_per_asset;
    if (max_sector_weight) {
        j["max_sector_weight"] = *max_sector_weight;
    } else {
        j["max_sector_weight"] = nullptr;
    }
    j["min_assets_held"] = min_assets_held;
    j["sector_map"] = sector_map;
    j["cap_mode"] = cap_mode_to_string(cap_mode);
    j["version"] = version;
    return j;
}

void RiskCapsConfig::from_json(const nlohmann::json& j) {
    if (j.contains("max_weight_per_asset"))
        max_weight_per_asset = j.at("max_weight_per_asset").get<double>();
    if (j.contains("max_sector_weight")) {
        if (j.at("max_sector_weight").is_null()) {
            max_sector_weight.reset();
        } else {
            max_sector_weight = j.at("max_sector_weight").get<double>();
        }
    }
    if (j.contains("min_assets_held"))
        min_assets_held = j.at("min_assets_held").get<int>();
    if (j.contains("sector_map"))
        sector_map = j.at("sector_map").get<std::map<std::string, std::string>>();
    if (j.contains("cap_mode")) {
        std::string value = j.at("cap_mode").get<std::string>();
        if (value == "both") {
            cap_mode = CapMode::BOTH;
        } else if (value == "pre_leverage") {
            cap_mode = CapMode::PRE_LEVERAGE;
        } else if (value == "post_leverage") {
            cap_mode = CapMode::POST_LEVERAGE;
        } else {
            throw std::invalid_argument("Invalid cap_mode: " + value);
        }
    }
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

RiskCapsOverlay::RiskCapsOverlay(PrivateTag, RiskCapsConfig config,
                                 std::vector<std::string> symbols)
    : config_(std::move(config)), symbols_(std::move(symbols)) {
    Logger::register_component("RiskCaps");

    std::map<std::string, size_t> sectors;
    sector_of_.reserve(symbols_.size());
    for (const auto& symbol : symbols_) {
        auto it = config_.sector_map.find(symbol);
        std::string sector = it == config_.sector_map.end() ? "Unknown" : it->second;
        auto inserted = sectors.emplace(sector, sectors.size());
        sector_of_.push_back(inserted.first->second);
    }
    num_sectors_ = sectors.size();
}

Result<std::unique_ptr<RiskCapsOverlay>> RiskCapsOverlay::create(
    RiskCapsConfig config, std::vector<std::string> symbols) {
    auto valid = config.validate();
    if (valid.is_error()) {
        return forward_error<std::unique_ptr<RiskCapsOverlay>>(valid.error());
    }
    if (static_cast<size_t>(config.min_assets_held) > symbols.size()) {
        return make_error<std::unique_ptr<RiskCapsOverlay>>(
            ErrorCode::INVALID_CONFIG,
            "min_assets_held (" + std::to_string(config.min_assets_held) +
                ") cannot exceed number of assets (" + std::to_string(symbols.size()) + ")",
            "RiskCapsOverlay");
    }
    return std::make_unique<RiskCapsOverlay>(PrivateTag{}, std::move(config), std::move(symbols));
}

void RiskCapsOverlay::cap_assets(WeightVector& w) const {
    const double cap = config_.max_weight_per_asset;
    const double total = gross_of(w);
    for (int iteration = 0; iteration < MAX_ITERATIONS; ++iteration) {
        size_t exceeding = 0;
        double uncapped = 0.0;
        for (double v : w) {
            if (std::abs(v) > cap) {
                ++exceeding;
            } else {
                uncapped += std::abs(v);
            }
        }
        if (exceeding == 0) {
            break;
        }
        double remaining = total - static_cast<double>(exceeding) * cap;
        double scale = uncapped > 0.0 ? remaining / uncapped : 0.0;
        for (double& v : w) {
            if (std::abs(v) > cap) {
                v = std::copysign(cap, v);
            } else {
                v *= scale;
            }
        }
    }
    for (double& v : w) {
        v = std::clamp(v, -cap, cap);
    }
}

bool RiskCapsOverlay::cap_sectors(WeightVector& w) const {
    const double cap = *config_.max_sector_weight;
    std::vector<double> exposure(num_sectors_, 0.0);
    for (size_t i = 0; i < w.size(); ++i) {
        exposure[sector_of_[i]] += std::abs(w[i]);
    }
    bool over = false;
    for (size_t i = 0; i < w.size(); ++i) {
        double sector_exposure = exposure[sector_of_[i]];
        if (sector_exposure > cap) {
            w[i] *= cap / sector_exposure;
            over = true;
        }
    }
    return over;
}

Result<OverlayOutput> RiskCapsOverlay::apply(const WeightVector& target) const {
    if (target.size() != symbols_.size()) {
        return make_error<OverlayOutput>(ErrorCode::INVALID_ARGUMENT,
                                         "Target row has " + std::to_string(target.size()) +
                                             " assets, risk caps configured for " +
                                             std::to_string(symbols_.size()),
                                         "RiskCapsOverlay");
    }

    OverlayOutput output;
    output.weights = target;
    WeightVector& w = output.weights;

    int active = 0;
    for (double v : w) {
        if (std::abs(v) > ACTIVE_EPSILON) {
            ++active;
        }
    }
    if (active == 0) {
        return output;
    }
    if (active < config_.min_assets_held) {
        DEBUG("Only " + std::to_string(active) + " active assets, below min_assets_held " +
              std::to_string(config_.min_assets_held) + "; flattening row");
        std::fill(w.begin(), w.end(), 0.0);
        return output;
    }

    cap_assets(w);
    if (config_.max_sector_weight) {
        const double total = gross_of(w);
        for (int iteration = 0; iteration < MAX_ITERATIONS; ++iteration) {
            if (!cap_sectors(w)) {
                break;
            }
            double after = gross_of(w);
            if (after > 0.0) {
                for (double& v : w) {
                    v *= total / after;
                }
            }
            cap_assets(w);
        }
        // Renormalization can leave a sector marginally over; the caps win over gross
        cap_sectors(w);
    }
    return output;
}

}  // namespace tempo_ngin
