// include/tempo_ngin/allocation/allocator_config.hpp
#pragma once

#include <string>
#include <vector>
#include "tempo_ngin/core/config_base.hpp"
#include "tempo_ngin/core/error.hpp"

namespace tempo_ngin {

/**
 * @brief Weight construction algorithms
 */
enum class AllocatorType {
    EQUAL_WEIGHT,
    INVERSE_VOLATILITY,
    MEAN_VARIANCE,
    RISK_PARITY
};

std::string allocator_type_to_string(AllocatorType type);
Result<AllocatorType> allocator_type_from_string(const std::string& name);

/**
 * @brief Upper bound on the summed weight of a set of assets
 */
struct GroupConstraint {
    std::string name;
    std::vector<std::string> members;  // Asset symbols
    double max_weight{1.0};
};

/**
 * @brief Configuration of the asset allocator and its fallback chain
 */
struct AllocatorConfig : public ConfigBase {
    AllocatorType type{AllocatorType::INVERSE_VOLATILITY};
    size_t lookback{60};             // Return observations used per rebalance
    double per_asset_cap{1.0};       // Upper bound on each weight
    double gross_exposure_cap{1.0};  // Weights sum to this target
    std::vector<AllocatorType> fallback_order{AllocatorType::MEAN_VARIANCE,
                                              AllocatorType::INVERSE_VOLATILITY,
                                              AllocatorType::EQUAL_WEIGHT};

    // Optimizer settings, fixed for reproducibility
    double risk_aversion{5.0};
    int max_iterations{10000};
    double tolerance{1e-10};
    double singularity_threshold{1e-10};  // Relative min/max eigenvalue bound
    double min_vol{1e-8};                 // Volatility floor

    std::vector<GroupConstraint> groups;

    std::string version{"1.0.0"};

    /**
     * @brief Ranges, fallback chain shape and group definitions
     */
    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace tempo_ngin
