#include "tempo_ngin/transaction_cost/cost_policy.hpp"
#include <cmath>

namespace tempo_ngin {
namespace transaction_cost {

Result<void> CostPolicy::validate() const {
    for (double value : {spread_bps, slippage_bps, impact_k_bps}) {
        if (!(value >= 0.0) || !std::isfinite(value)) {
            return make_error<void>(ErrorCode::INVALID_CONFIG,
                                    "Cost parameters must be finite and non-negative",
                                    "CostPolicy");
        }
    }
    if (!(participation_scale > 0.0) || !(max_participation > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "participation_scale and max_participation must be positive",
                                "CostPolicy");
    }
    return Result<void>();
}

nlohmann::json CostPolicy::to_json() const {
    nlohmann::json j;
    j["spread_bps"] = spread_bps;
    j["slippage_bps"] = slippage_bps;
    j["impact_k_bps"] = impact_k_bps;
    j["participation_scale"] = participation_scale;
    j["max_participation"] = max_participation;
    j["version"] = version;
    return j;
}

void CostPolicy::from_json(const nlohmann::json& j) {
    if (j.contains("spread_bps"))
        spread_bps = j.at("spread_bps").get<double>();
    if (j.contains("slippage_bps"))
        slippage_bps = j.at("slippage_bps").get<double>();
    if (j.contains("impact_k_bps"))
        impact_k_bps = j.at("impact_k_bps").get<double>();
    if (j.contains("participation_scale"))
        participation_scale = j.at("participation_scale").get<double>();
    if (j.contains("max_participation"))
        max_participation = j.at("max_participation").get<double>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

}  // namespace transaction_cost
}  // namespace tempo_ngin
