// include/tempo_ngin/backtest/walkforward_orchestrator.hpp
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "tempo_ngin/allocation/allocator.hpp"
#include "tempo_ngin/allocation/allocator_registry.hpp"
#include "tempo_ngin/backtest/result_accumulator.hpp"
#include "tempo_ngin/backtest/run_state.hpp"
#include "tempo_ngin/backtest/walkforward_config.hpp"
#include "tempo_ngin/backtest/walkforward_result.hpp"
#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/core/frame.hpp"
#include "tempo_ngin/data/market_data.hpp"
#include "tempo_ngin/execution/execution_module.hpp"
#include "tempo_ngin/execution/exposure_mapper.hpp"
#include "tempo_ngin/portfolio/portfolio_constructor.hpp"
#include "tempo_ngin/portfolio/portfolio_overlay.hpp"
#include "tempo_ngin/schedule/schedule_resolver.hpp"
#include "tempo_ngin/schedule/warmup_resolver.hpp"
#include "tempo_ngin/strategy/meta_combiner.hpp"
#include "tempo_ngin/strategy/strategy_interface.hpp"

namespace tempo_ngin {

/**
 * @brief Step-by-step walk-forward run over a market data snapshot
 *
 * At each step t the strategies see data up to t (concurrently, merged at
 * one point), their intent is validated and combined, mapped to exposures,
 * allocated on the allocation schedule from returns strictly before t,
 * constructed into a target, passed through the overlays and delayed into
 * held weights. Targets are zero before the parallel warmup. The result is
 * only handed out once every accounting check passed.
 */
class WalkforwardOrchestrator {
public:
    WalkforwardOrchestrator(WalkforwardConfig config, std::shared_ptr<const MarketData> data,
                            std::vector<std::unique_ptr<StrategyInterface>> strategies);

    ~WalkforwardOrchestrator() = default;

    WalkforwardOrchestrator(const WalkforwardOrchestrator&) = delete;
    WalkforwardOrchestrator& operator=(const WalkforwardOrchestrator&) = delete;

    /**
     * @brief Validate the configuration and build every layer
     * @return INVALID_CONFIG, INSUFFICIENT_WARMUP, or the error of the layer that failed
     */
    Result<void> initialize();

    /**
     * @brief Run all steps and freeze the result
     *
     * Can be called once, after a successful initialize().
     */
    Result<std::shared_ptr<const WalkforwardResult>> run();

    RunState state() const {
        return state_.state();
    }

    const std::string& failure_reason() const {
        return state_.failure_reason();
    }

    const WarmupPlan& warmup_plan() const {
        return plan_;
    }

private:
    struct StrategySlot {
        std::unique_ptr<StrategyInterface> strategy;
        std::vector<WeightVector> history;  // Intent row per position, zero before warmup
        bool trained{false};
    };

    struct StepDecision {
        StepRecord record;
        std::vector<WeightVector> overlay_inputs;  // Row each overlay received
    };

    Result<void> build_layers();

    Result<Intent> run_strategy(StrategySlot& slot, size_t t);
    Result<void> collect_intents(size_t t);
    Result<void> check_intent(const StrategySlot& slot, const Intent& intent, size_t t) const;

    Result<MetaWindow> build_meta_window(size_t t) const;
    Result<void> refresh_meta_weights(size_t t);
    Result<void> refresh_allocation(size_t t);

    Result<StepDecision> decide(size_t t);

    template <typename T>
    Result<T> fail(const TempoError* error);

    WalkforwardConfig config_;
    std::shared_ptr<const MarketData> data_;
    std::vector<StrategySlot> slots_;

    AllocatorRegistry registry_;
    std::unique_ptr<ExecutionModule> execution_;
    std::unique_ptr<ExposureMapper> exposure_mapper_;
    std::shared_ptr<const Allocator> allocator_;
    AllocationConstraints constraints_;
    std::unique_ptr<PortfolioConstructor> constructor_;
    std::unique_ptr<MetaCombiner> meta_;
    std::vector<std::unique_ptr<PortfolioOverlay>> overlays_;

    Frame returns_;
    WarmupPlan plan_;
    Schedule strategy_schedule_;
    Schedule meta_schedule_;
    Schedule allocation_schedule_;

    std::optional<std::map<std::string, double>> meta_weights_;
    std::optional<WeightVector> allocation_;
    std::unique_ptr<ResultAccumulator> accumulator_;

    RunStateMachine state_;
    bool initialized_{false};
};

}  // namespace tempo_ngin
