#include "tempo_ngin/execution/exposure_mapper.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include "tempo_ngin/core/logger.hpp"

namespace tempo_ngin {

std::string exposure_method_to_string(ExposureMethod method) {
    switch (method) {
        case ExposureMethod::RANK_THEN_NORMALIZE:
            return "rank_then_normalize";
        case ExposureMethod::ZSCORE_THEN_CLIP:
            return "zscore_then_clip";
        case ExposureMethod::PASSTHROUGH:
            return "passthrough";
        default:
            return "unknown";
    }
}

Result<void> ExposureConfig::validate() const {
    if (!(gross_exposure_cap > 0.0) || !std::isfinite(gross_exposure_cap)) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, "gross_exposure_cap must be positive",
                                "ExposureConfig");
    }
    if (!(per_asset_cap > 0.0) || per_asset_cap > 1.0) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, "per_asset_cap must be in (0, 1]",
                                "ExposureConfig");
    }
    if (!(zscore_clip > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, "zscore_clip must be positive",
                                "ExposureConfig");
    }
    if (net_exposure_target && std::abs(*net_exposure_target) > gross_exposure_cap) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "net_exposure_target exceeds gross_exposure_cap",
                                "ExposureConfig");
    }
    return Result<void>();
}

nlohmann::json ExposureConfig::to_json() const {
    nlohmann::json j;
    j["method"] = exposure_method_to_string(method);
    j["gross_exposure_cap"] = gross_exposure_cap;
    if (net_exposure_target) {
        j["net_exposure_target"] = *net_exposure_target;
    } else {
        j["net_exposure_target"] = nullptr;
    }
    j["per_asset_cap"] = per_asset_cap;
    j["zscore_clip"] = zscore_clip;
    j["version"] = version;
    return j;
}

void ExposureConfig::from_json(const nlohmann::json& j) {
    if (j.contains("method")) {
        std::string value = j.at("method").get<std::string>();
        if (value == "rank_then_normalize")
            method = ExposureMethod::RANK_THEN_NORMALIZE;
        else if (value == "zscore_then_clip")
            method = ExposureMethod::ZSCORE_THEN_CLIP;
        else if (value == "passthrough")
            method = ExposureMethod::PASSTHROUGH;
        else
            throw std::invalid_argument("Unknown exposure method: " + value);
    }
    if (j.contains("gross_exposure_cap"))
        gross_exposure_cap = j.at("gross_exposure_cap").get<double>();
    if (j.contains("net_exposure_target")) {
        if (j.at("net_exposure_target").is_null())
            net_exposure_target.reset();
        else
            net_exposure_target = j.at("net_exposure_target").get<double>();
    }
    if (j.contains("per_asset_cap"))
        per_asset_cap = j.at("per_asset_cap").get<double>();
    if (j.contains("zscore_clip"))
        zscore_clip = j.at("zscore_clip").get<double>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

ExposureMapper::ExposureMapper(ExposureConfig config) : config_(std::move(config)) {}

Result<WeightVector> ExposureMapper::map(const WeightVector& scores) const {
    for (size_t i = 0; i < scores.size(); ++i) {
        if (!std::isfinite(scores[i])) {
            return make_error<WeightVector>(ErrorCode::INTENT_VALIDATION_ERROR,
                                            "Non-finite score at asset " + std::to_string(i),
                                            "ExposureMapper");
        }
    }

    WeightVector exposures;
    switch (config_.method) {
        case ExposureMethod::RANK_THEN_NORMALIZE:
            exposures = rank_then_normalize(scores);
            break;
        case ExposureMethod::ZSCORE_THEN_CLIP:
            exposures = zscore_then_clip(scores);
            break;
        case ExposureMethod::PASSTHROUGH:
            exposures = scores;
            break;
    }

    apply_book_bounds(exposures);
    return exposures;
}

WeightVector ExposureMapper::rank_then_normalize(const WeightVector& scores) const {
    WeightVector exposures(scores.size(), 0.0);

    std::vector<size_t> active;
    for (size_t i = 0; i < scores.size(); ++i) {
        if (scores[i] != 0.0) {
            active.push_back(i);
        }
    }
    if (active.empty()) {
        return exposures;
    }

    std::stable_sort(active.begin(), active.end(), [&scores](size_t a, size_t b) {
        return std::abs(scores[a]) < std::abs(scores[b]);
    });

    // Average ranks over ties, 1-based
    std::vector<double> ranks(active.size());
    size_t start = 0;
    while (start < active.size()) {
        size_t end = start + 1;
        while (end < active.size() &&
               std::abs(scores[active[end]]) == std::abs(scores[active[start]])) {
            ++end;
        }
        double avg_rank = (static_cast<double>(start + 1) + static_cast<double>(end)) / 2.0;
        for (size_t k = start; k < end; ++k) {
            ranks[k] = avg_rank;
        }
        start = end;
    }

    double top_rank = ranks.back();
    for (size_t k = 0; k < active.size(); ++k) {
        size_t i = active[k];
        exposures[i] = (scores[i] > 0.0 ? 1.0 : -1.0) * ranks[k] / top_rank;
    }
    return exposures;
}

WeightVector ExposureMapper::zscore_then_clip(const WeightVector& scores) const {
    WeightVector exposures(scores.size(), 0.0);
    if (scores.size() < 2) {
        return exposures;
    }

    double n = static_cast<double>(scores.size());
    double mean = std::accumulate(scores.begin(), scores.end(), 0.0) / n;
    double sq_sum = 0.0;
    for (double s : scores) {
        sq_sum += (s - mean) * (s - mean);
    }
    double std_dev = std::sqrt(sq_sum / (n - 1.0));
    if (std_dev <= 0.0) {
        // A constant row carries no cross-sectional information
        return exposures;
    }

    for (size_t i = 0; i < scores.size(); ++i) {
        double z = (scores[i] - mean) / std_dev;
        z = std::clamp(z, -config_.zscore_clip, config_.zscore_clip);
        exposures[i] = z / config_.zscore_clip;
    }
    return exposures;
}

void ExposureMapper::apply_book_bounds(WeightVector& exposures) const {
    const double cap = config_.per_asset_cap;
    for (double& e : exposures) {
        e = std::clamp(e, -cap, cap);
    }

    size_t active = 0;
    double long_book = 0.0;
    double short_book = 0.0;
    for (double e : exposures) {
        if (e > 0.0) {
            long_book += e;
            ++active;
        } else if (e < 0.0) {
            short_book -= e;
            ++active;
        }
    }
    if (active == 0) {
        return;
    }

    double gross = long_book + short_book;
    double gross_limit = config_.gross_exposure_cap * static_cast<double>(active);
    if (gross > gross_limit) {
        double scale = gross_limit / gross;
        for (double& e : exposures) {
            e *= scale;
        }
        long_book *= scale;
        short_book *= scale;
        gross = gross_limit;
    }

    if (!config_.net_exposure_target) {
        return;
    }
    if (long_book <= 0.0 || short_book <= 0.0) {
        DEBUG("Net exposure target needs both a long and a short book, leaving exposures as mapped");
        return;
    }

    double net = std::clamp(*config_.net_exposure_target * static_cast<double>(active), -gross,
                            gross);
    double long_scale = ((gross + net) / 2.0) / long_book;
    double short_scale = ((gross - net) / 2.0) / short_book;
    for (double& e : exposures) {
        e *= e > 0.0 ? long_scale : short_scale;
        e = std::clamp(e, -cap, cap);
    }
}

}  // namespace tempo_ngin
