// include/tempo_ngin/execution/exposure_mapper.hpp
#pragma once

#include <optional>
#include <string>
#include "tempo_ngin/core/config_base.hpp"
#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/core/types.hpp"

namespace tempo_ngin {

/**
 * @brief Method used to turn scores into exposures
 */
enum class ExposureMethod {
    RANK_THEN_NORMALIZE,  // Signed rank of |score| over non-zero scores, scaled to the top rank
    ZSCORE_THEN_CLIP,     // Cross-sectional z-score, clipped and scaled to [-1, 1]
    PASSTHROUGH           // Scores used as exposures, clipped to the per-asset cap
};

std::string exposure_method_to_string(ExposureMethod method);

/**
 * @brief Bounds applied to mapped exposures
 *
 * Exposures are per-asset convictions in [-per_asset_cap, per_asset_cap].
 * The gross cap bounds the mean absolute exposure over active assets; the
 * optional net target sets the mean signed exposure over active assets by
 * rescaling the long and short books.
 */
struct ExposureConfig : public ConfigBase {
    ExposureMethod method{ExposureMethod::RANK_THEN_NORMALIZE};
    double gross_exposure_cap{1.0};
    std::optional<double> net_exposure_target;
    double per_asset_cap{1.0};
    double zscore_clip{2.0};

    std::string version{"1.0.0"};

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Maps one row of intent to bounded exposures
 */
class ExposureMapper {
public:
    explicit ExposureMapper(ExposureConfig config);

    /**
     * @brief Map scores to exposures
     * @param scores One score per asset, finite
     * @return Exposures, same length, zero where the score is zero
     */
    Result<WeightVector> map(const WeightVector& scores) const;

    const ExposureConfig& config() const {
        return config_;
    }

private:
    WeightVector rank_then_normalize(const WeightVector& scores) const;
    WeightVector zscore_then_clip(const WeightVector& scores) const;
    void apply_book_bounds(WeightVector& exposures) const;

    ExposureConfig config_;
};

}  // namespace tempo_ngin
