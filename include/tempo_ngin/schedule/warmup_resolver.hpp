// include/tempo_ngin/schedule/warmup_resolver.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "tempo_ngin/core/error.hpp"

namespace tempo_ngin {

/**
 * @brief Trailing observations each layer needs before its output is usable
 */
struct LayerWarmups {
    size_t strategy{0};
    size_t meta{0};
    size_t allocator{0};
};

/**
 * @brief Composed warmup of a run
 *
 * signal = strategy + meta, parallel = max(signal, allocator),
 * total = parallel + execution_delay + vol_lookback.
 */
struct WarmupPlan {
    size_t strategy_warmup{0};
    size_t meta_warmup{0};
    size_t allocator_warmup{0};
    size_t execution_delay{0};
    size_t vol_lookback{0};

    size_t signal_warmup{0};
    size_t parallel_warmup{0};  // First step with non-zero targets
    size_t total_warmup{0};     // First step whose return is fully warmed up

    std::string description;

    nlohmann::json to_json() const;
};

class WarmupResolver {
public:
    static WarmupPlan compute(const LayerWarmups& layers, int execution_delay,
                              size_t vol_lookback);

    /**
     * @brief Check an index is long enough to leave steps after the warmup
     * @return INSUFFICIENT_WARMUP when available <= total_warmup
     */
    static Result<void> require(const WarmupPlan& plan, size_t available);

    /**
     * @brief Check a layer is not asked for output before its warmup
     * @return INSUFFICIENT_WARMUP when position < warmup
     */
    static Result<void> require_layer(const std::string& layer, size_t position, size_t warmup);
};

}  // namespace tempo_ngin
