#include "tempo_ngin/allocation/allocator_config.hpp"
#include <cmath>
#include <set>

namespace tempo_ngin {

std::string allocator_type_to_string(AllocatorType type) {
    switch (type) {
        case AllocatorType::EQUAL_WEIGHT:
            return "EQUAL_WEIGHT";
        case AllocatorType::INVERSE_VOLATILITY:
            return "INVERSE_VOLATILITY";
        case AllocatorType::MEAN_VARIANCE:
            return "MEAN_VARIANCE";
        case AllocatorType::RISK_PARITY:
            return "RISK_PARITY";
        default:
            return "UNKNOWN";
    }
}

Result<AllocatorType> allocator_type_from_string(const std::string& name) {
    if (name == "EQUAL_WEIGHT")
        return AllocatorType::EQUAL_WEIGHT;
    if (name == "INVERSE_VOLATILITY")
        return AllocatorType::INVERSE_VOLATILITY;
    if (name == "MEAN_VARIANCE")
        return AllocatorType::MEAN_VARIANCE;
    if (name == "RISK_PARITY")
        return AllocatorType::RISK_PARITY;
    return make_error<AllocatorType>(ErrorCode::INVALID_CONFIG, "Unknown allocator type: " + name,
                                     "AllocatorConfig");
}

Result<void> AllocatorConfig::validate() const {
    if (type != AllocatorType::EQUAL_WEIGHT && lookback < 2) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "lookback must be at least 2 for " + allocator_type_to_string(type),
                                "AllocatorConfig");
    }
    if (!(per_asset_cap > 0.0) || !std::isfinite(per_asset_cap)) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, "per_asset_cap must be positive",
                                "AllocatorConfig");
    }
    if (!(gross_exposure_cap > 0.0) || !std::isfinite(gross_exposure_cap)) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, "gross_exposure_cap must be positive",
                                "AllocatorConfig");
    }
    if (!(risk_aversion > 0.0) || max_iterations <= 0 || !(tolerance > 0.0) ||
        !(singularity_threshold > 0.0) || !(min_vol > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "Optimizer settings must be positive", "AllocatorConfig");
    }

    if (fallback_order.empty() || fallback_order.back() != AllocatorType::EQUAL_WEIGHT) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "fallback_order must end with EQUAL_WEIGHT", "AllocatorConfig");
    }
    std::set<AllocatorType> seen;
    for (auto link : fallback_order) {
        if (!seen.insert(link).second) {
            return make_error<void>(ErrorCode::INVALID_CONFIG,
                                    "fallback_order lists " + allocator_type_to_string(link) +
                                        " twice",
                                    "AllocatorConfig");
        }
    }

    for (const auto& group : groups) {
        if (group.members.empty()) {
            return make_error<void>(ErrorCode::INVALID_CONFIG,
                                    "Group '" + group.name + "' has no members",
                                    "AllocatorConfig");
        }
        if (!(group.max_weight > 0.0)) {
            return make_error<void>(ErrorCode::INVALID_CONFIG,
                                    "Group '" + group.name + "' max_weight must be positive",
                                    "AllocatorConfig");
        }
    }
    if (!groups.empty() && type != AllocatorType::MEAN_VARIANCE) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "Group constraints are only supported by MEAN_VARIANCE",
                                "AllocatorConfig");
    }
    return Result<void>();
}

nlohmann::json AllocatorConfig::to_json() const {
    nlohmann::json j;
    j["type"] = allocator_type_to_string(type);
    j["lookback"] = lookback;
    j["per_asset_cap"] = per_asset_cap;
    j["gross_exposure_cap"] = gross_exposure_cap;
    nlohmann::json chain = nlohmann::json::array();
    for (auto link : fallback_order) {
        chain.push_back(allocator_type_to_string(link));
    }
    j["fallback_order"] = chain;
    j["risk_aversion"] = risk_aversion;
    j["max_iterations"] = max_iterations;
    j["tolerance"] = tolerance;
    j["singularity_threshold"] = singularity_threshold;
    j["min_vol"] = min_vol;
    nlohmann::json group_list = nlohmann::json::array();
    for (const auto& group : groups) {
        group_list.push_back(
            {{"name", group.name}, {"members", group.members}, {"max_weight", group.max_weight}});
    }
    j["groups"] = group_list;
    j["version"] = version;
    return j;
}

void AllocatorConfig::from_json(const nlohmann::json& j) {
    if (j.contains("type"))
        type = allocator_type_from_string(j.at("type").get<std::string>()).value();
    if (j.contains("lookback"))
        lookback = j.at("lookback").get<size_t>();
    if (j.contains("per_asset_cap"))
        per_asset_cap = j.at("per_asset_cap").get<double>();
    if (j.contains("gross_exposure_cap"))
        gross_exposure_cap = j.at("gross_exposure_cap").get<double>();
    if (j.contains("fallback_order")) {
        fallback_order.clear();
        for (const auto& link : j.at("fallback_order")) {
            fallback_order.push_back(allocator_type_from_string(link.get<std::string>()).value());
        }
    }
    if (j.contains("risk_aversion"))
        risk_aversion = j.at("risk_aversion").get<double>();
    if (j.contains("max_iterations"))
        max_iterations = j.at("max_iterations").get<int>();
    if (j.contains("tolerance"))
        tolerance = j.at("tolerance").get<double>();
    if (j.contains("singularity_threshold"))
        singularity_threshold = j.at("singularity_threshold").get<double>();
    if (j.contains("min_vol"))
        min_vol = j.at("min_vol").get<double>();
    if (j.contains("groups")) {
        groups.clear();
        for (const auto& item : j.at("groups")) {
            GroupConstraint group;
            group.name = item.at("name").get<std::string>();
            group.members = item.at("members").get<std::vector<std::string>>();
            group.max_weight = item.at("max_weight").get<double>();
            groups.push_back(std::move(group));
        }
    }
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

}  // namespace tempo_ngin
