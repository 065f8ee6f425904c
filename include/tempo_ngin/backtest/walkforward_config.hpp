// include/tempo_ngin/backtest/walkforward_config.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "tempo_ngin/allocation/allocator_config.hpp"
#include "tempo_ngin/core/config_base.hpp"
#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/execution/execution_policy.hpp"
#include "tempo_ngin/execution/exposure_mapper.hpp"
#include "tempo_ngin/portfolio/risk_caps.hpp"
#include "tempo_ngin/portfolio/vol_targeting.hpp"
#include "tempo_ngin/schedule/schedule_resolver.hpp"
#include "tempo_ngin/strategy/meta_combiner.hpp"
#include "tempo_ngin/transaction_cost/cost_policy.hpp"

namespace tempo_ngin {

/**
 * @brief Complete configuration of a walk-forward run
 *
 * Built once, validated once at initialize(), never mutated by the run.
 */
struct WalkforwardConfig : public ConfigBase {
    ExecutionPolicy execution;
    ExposureConfig exposure;
    AllocatorConfig allocator;
    MetaConfig meta;
    transaction_cost::CostPolicy costs;
    std::optional<RiskCapsConfig> risk_caps;
    std::optional<VolTargetingConfig> vol_targeting;

    // Recompute cadence per layer
    ScheduleConfig strategy_schedule{Frequency::NONE};
    ScheduleConfig meta_schedule{Frequency::DAILY};
    ScheduleConfig allocation_schedule{Frequency::DAILY};

    size_t train_window{252};  // Trailing observations a strategy is retrained on

    std::string version{"1.0.0"};

    /**
     * @brief Validate every section and the combinations between them
     */
    Result<void> validate() const override;

    /**
     * @brief Checks that depend on the asset universe
     * @return INVALID_CONFIG when the gross target cannot be met under the caps
     */
    Result<void> validate_universe(const std::vector<std::string>& symbols) const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace tempo_ngin
