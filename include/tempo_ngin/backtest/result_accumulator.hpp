// include/tempo_ngin/backtest/result_accumulator.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "tempo_ngin/backtest/walkforward_result.hpp"
#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/core/frame.hpp"
#include "tempo_ngin/execution/execution_module.hpp"
#include "tempo_ngin/schedule/warmup_resolver.hpp"
#include "tempo_ngin/transaction_cost/cost_policy.hpp"

namespace tempo_ngin {

/**
 * @brief Everything the step loop decided at one timestamp
 */
struct StepRecord {
    WeightVector target;       // Final target after overlays
    WeightVector held;         // Output of the run's delay line
    WeightVector pre_overlay;  // Target before risk caps and vol targeting
    WeightVector signal;       // Equal-risk signal weights
    double leverage{1.0};      // Product of the overlay scales
};

/**
 * @brief Sole writer of a run's result
 *
 * Collects step records in index order and, at finalization, runs the cost
 * model and the accounting checks before freezing the result:
 *   held == apply_delay(target), element for element
 *   |gross - (signal + allocation + leverage)| <= 1e-9 + 1e-6 * |gross|
 *   net == gross - (spread + slippage + impact), exactly
 */
class ResultAccumulator {
public:
    static constexpr double CONSERVATION_ABS_TOLERANCE = 1e-9;
    static constexpr double CONSERVATION_REL_TOLERANCE = 1e-6;

    ResultAccumulator(TimeIndex index, std::vector<std::string> symbols);

    /**
     * @brief Record the step at the next index position
     * @return INVALID_STATE out of order or after finalization,
     *         INVALID_ARGUMENT for rows of the wrong width
     */
    Result<void> append(size_t position, StepRecord record);

    void add_warning(std::string warning);

    size_t size() const {
        return targets_.size();
    }

    /**
     * @brief Account the run and freeze the result
     * @param returns Asset returns on the run index
     * @param first_scored First position included in the performance metrics
     * @return ATTRIBUTION_CONSERVATION_ERROR when any accounting check fails
     */
    Result<std::shared_ptr<const WalkforwardResult>> finalize(
        const ExecutionModule& execution, const transaction_cost::CostPolicy& costs,
        const Frame& returns, const WarmupPlan& plan, size_t first_scored,
        nlohmann::json config);

private:
    Result<Frame> to_frame(std::vector<WeightVector> rows) const;

    Result<void> check_single_shift(const ExecutionModule& execution, const Frame& target,
                                    const Frame& held) const;

    TimeIndex index_;
    std::vector<std::string> symbols_;
    std::vector<WeightVector> targets_;
    std::vector<WeightVector> held_;
    std::vector<WeightVector> pre_overlay_;
    std::vector<WeightVector> signal_;
    std::vector<double> leverage_;
    std::vector<std::string> warnings_;
    bool finalized_{false};
};

}  // namespace tempo_ngin
