// include/tempo_ngin/transaction_cost/cost_policy.hpp
#pragma once

#include <string>
#include "tempo_ngin/core/config_base.hpp"
#include "tempo_ngin/core/error.hpp"

namespace tempo_ngin {
namespace transaction_cost {

/**
 * @brief Cost parameters of a run, expressed against portfolio turnover
 *
 * All zero means a cost-free run.
 */
struct CostPolicy : public ConfigBase {
    double spread_bps{0.0};            // Full quoted spread; half is paid per unit of turnover
    double slippage_bps{0.0};          // Linear slippage per unit of turnover
    double impact_k_bps{0.0};          // Square-root impact coefficient
    double participation_scale{1.0};   // Turnover at which participation reaches 1
    double max_participation{1.0};     // Participation cap

    std::string version{"1.0.0"};

    bool is_zero() const {
        return spread_bps == 0.0 && slippage_bps == 0.0 && impact_k_bps == 0.0;
    }

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace transaction_cost
}  // namespace tempo_ngin
