#include "tempo_ngin/schedule/warmup_resolver.hpp"
#include <algorithm>
#include <sstream>

namespace tempo_ngin {

nlohmann::json WarmupPlan::to_json() const {
    nlohmann::json j;
    j["strategy_warmup"] = strategy_warmup;
    j["meta_warmup"] = meta_warmup;
    j["allocator_warmup"] = allocator_warmup;
    j["execution_delay"] = execution_delay;
    j["vol_lookback"] = vol_lookback;
    j["signal_warmup"] = signal_warmup;
    j["parallel_warmup"] = parallel_warmup;
    j["total_warmup"] = total_warmup;
    j["description"] = description;
    return j;
}

WarmupPlan WarmupResolver::compute(const LayerWarmups& layers, int execution_delay,
                                   size_t vol_lookback) {
    WarmupPlan plan;
    plan.strategy_warmup = layers.strategy;
    plan.meta_warmup = layers.meta;
    plan.allocator_warmup = layers.allocator;
    plan.execution_delay = static_cast<size_t>(std::max(execution_delay, 0));
    plan.vol_lookback = vol_lookback;

    plan.signal_warmup = plan.strategy_warmup + plan.meta_warmup;
    plan.parallel_warmup = std::max(plan.signal_warmup, plan.allocator_warmup);
    plan.total_warmup = plan.parallel_warmup + plan.execution_delay + plan.vol_lookback;

    std::ostringstream os;
    os << "max(strategy " << plan.strategy_warmup << "d + meta " << plan.meta_warmup
       << "d, allocator " << plan.allocator_warmup << "d) + delay " << plan.execution_delay
       << "d + vol targeting " << plan.vol_lookback << "d = " << plan.total_warmup
       << " trading days";
    plan.description = os.str();
    return plan;
}

Result<void> WarmupResolver::require(const WarmupPlan& plan, size_t available) {
    if (available <= plan.total_warmup) {
        return make_error<void>(ErrorCode::INSUFFICIENT_WARMUP,
                                "Index has " + std::to_string(available) +
                                    " observations, warmup needs more than " +
                                    std::to_string(plan.total_warmup) + " (" + plan.description +
                                    ")",
                                "WarmupResolver");
    }
    return Result<void>();
}

Result<void> WarmupResolver::require_layer(const std::string& layer, size_t position,
                                           size_t warmup) {
    if (position < warmup) {
        return make_error<void>(ErrorCode::INSUFFICIENT_WARMUP,
                                layer + " asked for output at step " + std::to_string(position) +
                                    " before its warmup of " + std::to_string(warmup) +
                                    " observations",
                                "WarmupResolver");
    }
    return Result<void>();
}

}  // namespace tempo_ngin
