// include/tempo_ngin/backtest/walkforward_result.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "tempo_ngin/backtest/performance_calculator.hpp"
#include "tempo_ngin/core/frame.hpp"
#include "tempo_ngin/core/time_index.hpp"
#include "tempo_ngin/schedule/warmup_resolver.hpp"
#include "tempo_ngin/transaction_cost/cost_model.hpp"

namespace tempo_ngin {

/**
 * @brief Daily decomposition of the gross return
 *
 * signal: delayed equal-risk signal weights times returns
 * allocation: delayed pre-overlay target minus signal weights, times returns
 * leverage: held weights minus delayed pre-overlay target, times returns
 */
struct AttributionComponents {
    std::vector<double> signal;
    std::vector<double> allocation;
    std::vector<double> leverage;
};

/**
 * @brief Frozen outcome of a completed walk-forward run
 *
 * Only the ResultAccumulator builds one; everything is read-only afterwards.
 */
class WalkforwardResult {
    struct PrivateTag {};
    friend class ResultAccumulator;

public:
    explicit WalkforwardResult(PrivateTag) {}

    const TimeIndex& index() const {
        return index_;
    }

    const std::vector<std::string>& symbols() const {
        return target_weights_.columns();
    }

    const std::vector<double>& equity_curve() const {
        return equity_curve_;
    }

    const Frame& target_weights() const {
        return target_weights_;
    }

    const Frame& held_weights() const {
        return held_weights_;
    }

    const std::vector<double>& gross_returns() const {
        return accounting_.gross;
    }

    const std::vector<double>& net_returns() const {
        return accounting_.net;
    }

    const transaction_cost::CostComponents& costs() const {
        return accounting_.costs;
    }

    const std::vector<double>& turnover() const {
        return accounting_.turnover;
    }

    const AttributionComponents& attribution() const {
        return attribution_;
    }

    const std::vector<double>& leverage() const {
        return leverage_;
    }

    const WarmupPlan& warmup_plan() const {
        return warmup_plan_;
    }

    const std::vector<std::string>& warnings() const {
        return warnings_;
    }

    const PerformanceMetrics& metrics() const {
        return metrics_;
    }

    const nlohmann::json& config() const {
        return config_;
    }

    /**
     * @brief Stable export schema
     */
    nlohmann::json to_json() const;

private:
    TimeIndex index_;
    Frame target_weights_;
    Frame held_weights_;
    transaction_cost::CostModelOutput accounting_;
    AttributionComponents attribution_;
    std::vector<double> equity_curve_;
    std::vector<double> leverage_;
    WarmupPlan warmup_plan_;
    std::vector<std::string> warnings_;
    PerformanceMetrics metrics_;
    nlohmann::json config_;
};

}  // namespace tempo_ngin
