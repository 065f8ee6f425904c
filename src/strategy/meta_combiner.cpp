#include "tempo_ngin/strategy/meta_combiner.hpp"
#include <algorithm>
#include <cmath>
#include "tempo_ngin/allocation/weight_utils.hpp"
#include "tempo_ngin/core/logger.hpp"
#include "tempo_ngin/core/time_utils.hpp"
#include "tempo_ngin/statistics/statistics_tools.hpp"

namespace tempo_ngin {

std::string meta_method_to_string(MetaMethod method) {
    switch (method) {
        case MetaMethod::FIXED_WEIGHT:
            return "fixed_weight";
        case MetaMethod::INVERSE_VOLATILITY:
            return "inverse_volatility";
        default:
            return "unknown";
    }
}

Result<void> MetaConfig::validate() const {
    if (!weights.empty()) {
        double total = 0.0;
        for (const auto& entry : weights) {
            if (!(entry.second >= 0.0) || !std::isfinite(entry.second)) {
                return make_error<void>(ErrorCode::INVALID_CONFIG,
                                        "weight for '" + entry.first + "' must be >= 0",
                                        "MetaConfig");
            }
            total += entry.second;
        }
        if (std::abs(total - 1.0) > 1e-6) {
            return make_error<void>(ErrorCode::INVALID_CONFIG,
                                    "weights must sum to 1.0, got " + std::to_string(total),
                                    "MetaConfig");
        }
    }
    if (method == MetaMethod::INVERSE_VOLATILITY && (vol_lookback < 10 || vol_lookback > 252)) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "vol_lookback must be in [10, 252], got " +
                                    std::to_string(vol_lookback),
                                "MetaConfig");
    }
    if (min_weight < 0.0 || max_weight > 1.0 || !(min_weight < max_weight)) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "Require 0 <= min_weight < max_weight <= 1", "MetaConfig");
    }
    if (!(min_vol > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, "min_vol must be positive",
                                "MetaConfig");
    }
    return Result<void>();
}

nlohmann::json MetaConfig::to_json() const {
    nlohmann::json j;
    j["method"] = meta_method_to_string(method);
    j["weights"] = weights;
    j["vol_lookback"] = vol_lookback;
    j["min_weight"] = min_weight;
    j["max_weight"] = max_weight;
    j["min_vol"] = min_vol;
    j["version"] = version;
    return j;
}

void MetaConfig::from_json(const nlohmann::json& j) {
    if (j.contains("method")) {
        std::string value = j.at("method").get<std::string>();
        if (value == "fixed_weight") {
            method = MetaMethod::FIXED_WEIGHT;
        } else if (value == "inverse_volatility") {
            method = MetaMethod::INVERSE_VOLATILITY;
        } else {
            throw std::invalid_argument("Unknown meta method: " + value);
        }
    }
    if (j.contains("weights"))
        weights = j.at("weights").get<std::map<std::string, double>>();
    if (j.contains("vol_lookback"))
        vol_lookback = j.at("vol_lookback").get<size_t>();
    if (j.contains("min_weight"))
        min_weight = j.at("min_weight").get<double>();
    if (j.contains("max_weight"))
        max_weight = j.at("max_weight").get<double>();
    if (j.contains("min_vol"))
        min_vol = j.at("min_vol").get<double>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<WeightVector> MetaCombiner::combine(const std::map<std::string, double>& weights,
                                           const std::map<std::string, WeightVector>& rows) {
    if (weights.size() != rows.size()) {
        return make_error<WeightVector>(ErrorCode::INVALID_ARGUMENT,
                                        std::to_string(weights.size()) + " strategy weights for " +
                                            std::to_string(rows.size()) + " intent rows",
                                        "MetaCombiner");
    }
    WeightVector combined;
    for (const auto& entry : rows) {
        auto it = weights.find(entry.first);
        if (it == weights.end()) {
            return make_error<WeightVector>(ErrorCode::INVALID_ARGUMENT,
                                            "No weight for strategy '" + entry.first + "'",
                                            "MetaCombiner");
        }
        if (combined.empty()) {
            combined.assign(entry.second.size(), 0.0);
        } else if (combined.size() != entry.second.size()) {
            return make_error<WeightVector>(ErrorCode::INVALID_ARGUMENT,
                                            "Strategy '" + entry.first +
                                                "' intent row has a different width",
                                            "MetaCombiner");
        }
        for (size_t i = 0; i < combined.size(); ++i) {
            combined[i] += it->second * entry.second[i];
        }
    }
    return combined;
}

FixedWeightMeta::FixedWeightMeta(std::map<std::string, double> weights)
    : weights_(std::move(weights)) {}

Result<std::map<std::string, double>> FixedWeightMeta::compute_weights(
    const MetaWindow&) const {
    return weights_;
}

InverseVolatilityMeta::InverseVolatilityMeta(MetaConfig config, ExecutionModule execution)
    : config_(std::move(config)), execution_(std::move(execution)) {
    Logger::register_component("MetaCombiner");
}

size_t InverseVolatilityMeta::warmup_period() const {
    return config_.vol_lookback + static_cast<size_t>(execution_.delay());
}

Result<double> InverseVolatilityMeta::strategy_volatility(const Intent& intent,
                                                          const SeriesMap& raw_returns) const {
    auto realized = execution_.compute_meta_raw_returns(intent, raw_returns);
    if (realized.is_error()) {
        return forward_error<double>(realized.error());
    }
    const SeriesMap& per_asset = realized.value();
    const size_t rows = per_asset.begin()->second.size();
    const size_t skip = static_cast<size_t>(execution_.delay());

    statistics::RollingWindow window(config_.vol_lookback);
    for (size_t t = skip; t < rows; ++t) {
        double total = 0.0;
        for (const auto& entry : per_asset) {
            total += entry.second.values[t];
        }
        window.push(total / static_cast<double>(per_asset.size()));
    }
    return window.std_dev();
}

Result<std::map<std::string, double>> InverseVolatilityMeta::compute_weights(
    const MetaWindow& window) const {
    using WeightMap = std::map<std::string, double>;
    if (window.intents.empty() || window.raw_returns.empty()) {
        return make_error<WeightMap>(ErrorCode::INVALID_ARGUMENT, "Empty meta window",
                                     "InverseVolatilityMeta");
    }
    const TimeIndex& index = window.raw_returns.begin()->second.index;
    if (!index.empty() && !(index.back() < window.as_of)) {
        ERROR("Meta window ends " << core::format_date(index.back())
                                  << ", not before the decision date "
                                  << core::format_date(window.as_of));
        return make_error<WeightMap>(ErrorCode::LOOKAHEAD_VIOLATION,
                                     "Meta window reaches the decision date " +
                                         core::format_date(window.as_of),
                                     "InverseVolatilityMeta");
    }

    std::vector<std::string> names;
    WeightVector raw;
    for (const auto& entry : window.intents) {
        auto vol = strategy_volatility(entry.second, window.raw_returns);
        if (vol.is_error()) {
            return forward_error<WeightMap>(vol.error());
        }
        names.push_back(entry.first);
        raw.push_back(std::max(1.0 / std::max(vol.value(), config_.min_vol), 0.0));
    }

    double total = weights::sum(raw);
    for (double& w : raw) {
        w = std::max(w / total, config_.min_weight);
    }
    WeightVector caps(raw.size(), config_.max_weight);
    auto capped = weights::cap_and_renormalize(raw, caps, 1.0);
    if (capped.is_error()) {
        return forward_error<WeightMap>(capped.error());
    }

    WeightMap result;
    for (size_t k = 0; k < names.size(); ++k) {
        result[names[k]] = capped.value()[k];
    }
    return result;
}

Result<std::unique_ptr<MetaCombiner>> make_meta_combiner(
    const MetaConfig& config, const std::vector<std::string>& strategy_names,
    const ExecutionModule& execution) {
    using Ptr = std::unique_ptr<MetaCombiner>;
    auto valid = config.validate();
    if (valid.is_error()) {
        return forward_error<Ptr>(valid.error());
    }
    if (strategy_names.empty()) {
        return make_error<Ptr>(ErrorCode::INVALID_CONFIG, "No strategies to combine",
                               "MetaCombiner");
    }
    if (static_cast<double>(strategy_names.size()) * config.max_weight < 1.0 - 1e-12) {
        return make_error<Ptr>(ErrorCode::INVALID_CONFIG,
                               "max_weight " + std::to_string(config.max_weight) +
                                   " cannot cover " + std::to_string(strategy_names.size()) +
                                   " strategies",
                               "MetaCombiner");
    }

    if (config.method == MetaMethod::INVERSE_VOLATILITY) {
        return Ptr(std::make_unique<InverseVolatilityMeta>(config, execution));
    }

    std::map<std::string, double> weights = config.weights;
    if (weights.empty()) {
        for (const auto& name : strategy_names) {
            weights[name] = 1.0 / static_cast<double>(strategy_names.size());
        }
    }
    for (const auto& name : strategy_names) {
        if (weights.find(name) == weights.end()) {
            return make_error<Ptr>(ErrorCode::INVALID_CONFIG,
                                   "No weight specified for strategy '" + name + "'",
                                   "MetaCombiner");
        }
    }
    if (weights.size() != strategy_names.size()) {
        return make_error<Ptr>(ErrorCode::INVALID_CONFIG,
                               "Weights name a strategy that is not configured", "MetaCombiner");
    }
    return Ptr(std::make_unique<FixedWeightMeta>(std::move(weights)));
}

}  // namespace tempo_ngin
