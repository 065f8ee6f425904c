#include "tempo_ngin/backtest/walkforward_config.hpp"
#include <algorithm>

namespace tempo_ngin {

namespace {

Result<void> validate_section(const ConfigBase& section, const std::string& name) {
    auto valid = section.validate();
    if (valid.is_error()) {
        return make_error<void>(valid.error()->code(), name + ": " + valid.error()->what(),
                                "WalkforwardConfig");
    }
    return Result<void>();
}

}  // namespace

Result<void> WalkforwardConfig::validate() const {
    const std::pair<const ConfigBase*, const char*> sections[] = {
        {&execution, "execution"},
        {&exposure, "exposure"},
        {&allocator, "allocator"},
        {&meta, "meta"},
        {&costs, "costs"},
        {&strategy_schedule, "strategy_schedule"},
        {&meta_schedule, "meta_schedule"},
        {&allocation_schedule, "allocation_schedule"},
    };
    for (const auto& section : sections) {
        auto valid = validate_section(*section.first, section.second);
        if (valid.is_error()) {
            return valid;
        }
    }
    if (risk_caps) {
        auto valid = validate_section(*risk_caps, "risk_caps");
        if (valid.is_error()) {
            return valid;
        }
    }
    if (vol_targeting) {
        auto valid = validate_section(*vol_targeting, "vol_targeting");
        if (valid.is_error()) {
            return valid;
        }
    }

    if (train_window == 0) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, "train_window must be positive",
                                "WalkforwardConfig");
    }

    // Group limits live inside the mean-variance optimizer
    if (risk_caps && !allocator.groups.empty()) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "Allocator group constraints cannot be combined with external "
                                "risk caps",
                                "WalkforwardConfig");
    }
    return Result<void>();
}

Result<void> WalkforwardConfig::validate_universe(const std::vector<std::string>& symbols) const {
    if (symbols.empty()) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, "Empty asset universe",
                                "WalkforwardConfig");
    }
    const double n = static_cast<double>(symbols.size());
    if (n * allocator.per_asset_cap < allocator.gross_exposure_cap) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "Gross target " + std::to_string(allocator.gross_exposure_cap) +
                                    " is infeasible with " + std::to_string(symbols.size()) +
                                    " assets capped at " +
                                    std::to_string(allocator.per_asset_cap),
                                "WalkforwardConfig");
    }
    if (risk_caps) {
        if (n * risk_caps->max_weight_per_asset < allocator.gross_exposure_cap) {
            return make_error<void>(
                ErrorCode::INVALID_CONFIG,
                "Infeasible constraints: " + std::to_string(symbols.size()) + " assets * " +
                    "max_weight_per_asset (" + std::to_string(risk_caps->max_weight_per_asset) +
                    ") is below the gross target " +
                    std::to_string(allocator.gross_exposure_cap),
                "WalkforwardConfig");
        }
        if (static_cast<size_t>(risk_caps->min_assets_held) > symbols.size()) {
            return make_error<void>(ErrorCode::INVALID_CONFIG,
                                    "min_assets_held exceeds the number of assets",
                                    "WalkforwardConfig");
        }
    }
    for (const auto& group : allocator.groups) {
        for (const auto& member : group.members) {
            if (std::find(symbols.begin(), symbols.end(), member) == symbols.end()) {
                return make_error<void>(ErrorCode::INVALID_CONFIG,
                                        "Group '" + group.name + "' names unknown asset '" +
                                            member + "'",
                                        "WalkforwardConfig");
            }
        }
    }
    return Result<void>();
}

nlohmann::json WalkforwardConfig::to_json() const {
    nlohmann::json j;
    j["execution"] = execution.to_json();
    j["exposure"] = exposure.to_json();
    j["allocator"] = allocator.to_json();
    j["meta"] = meta.to_json();
    j["costs"] = costs.to_json();
    j["risk_caps"] = risk_caps ? risk_caps->to_json() : nlohmann::json(nullptr);
    j["vol_targeting"] = vol_targeting ? vol_targeting->to_json() : nlohmann::json(nullptr);
    j["strategy_schedule"] = strategy_schedule.to_json();
    j["meta_schedule"] = meta_schedule.to_json();
    j["allocation_schedule"] = allocation_schedule.to_json();
    j["train_window"] = train_window;
    j["version"] = version;
    return j;
}

void WalkforwardConfig::from_json(const nlohmann::json& j) {
    if (j.contains("execution"))
        execution.from_json(j.at("execution"));
    if (j.contains("exposure"))
        exposure.from_json(j.at("exposure"));
    if (j.contains("allocator"))
        allocator.from_json(j.at("allocator"));
    if (j.contains("meta"))
        meta.from_json(j.at("meta"));
    if (j.contains("costs"))
        costs.from_json(j.at("costs"));
    if (j.contains("risk_caps")) {
        if (j.at("risk_caps").is_null()) {
            risk_caps.reset();
        } else {
            RiskCapsConfig caps;
            caps.from_json(j.at("risk_caps"));
            risk_caps = caps;
        }
    }
    if (j.contains("vol_targeting")) {
        if (j.at("vol_targeting").is_null()) {
            vol_targeting.reset();
        } else {
            VolTargetingConfig vol;
            vol.from_json(j.at("vol_targeting"));
            vol_targeting = vol;
        }
    }
    if (j.contains("strategy_schedule"))
        strategy_schedule.from_json(j.at("strategy_schedule"));
    if (j.contains("meta_schedule"))
        meta_schedule.from_json(j.at("meta_schedule"));
    if (j.contains("allocation_schedule"))
        allocation_schedule.from_json(j.at("allocation_schedule"));
    if (j.contains("train_window"))
        train_window = j.at("train_window").get<size_t>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

}  // namespace tempo_ngin
