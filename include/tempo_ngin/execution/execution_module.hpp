// include/tempo_ngin/execution/execution_module.hpp
#pragma once

#include <deque>
#include <memory>
#include <string>
#include <vector>
#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/core/frame.hpp"
#include "tempo_ngin/core/time_index.hpp"
#include "tempo_ngin/core/types.hpp"
#include "tempo_ngin/execution/execution_policy.hpp"
#include "tempo_ngin/execution/exposure_mapper.hpp"

namespace tempo_ngin {

/**
 * @brief Per-asset intent at decision time, keyed by symbol
 */
using Intent = SeriesMap;

/**
 * @brief Streaming execution delay
 *
 * Target rows go in, held rows come out execution_delay_days pushes later.
 * The first execution_delay_days held rows are zero (no position). Only the
 * ExecutionModule can create one.
 */
class DelayLine {
public:
    /**
     * @brief Push the target row of the current step
     * @return Held row for the current step
     */
    Result<WeightVector> push(const WeightVector& target);

    size_t width() const {
        return width_;
    }

    int delay() const {
        return delay_;
    }

private:
    friend class ExecutionModule;
    DelayLine(size_t width, int delay);

    size_t width_;
    int delay_;
    std::deque<WeightVector> pending_;
};

/**
 * @brief Single authority for execution timing and alignment
 *
 * Every time shift of the pipeline goes through apply_delay or a DelayLine
 * made here. Inputs are never mutated and outputs are never partially valid.
 */
class ExecutionModule {
public:
    explicit ExecutionModule(std::shared_ptr<const ExecutionPolicy> policy);

    const ExecutionPolicy& policy() const {
        return *policy_;
    }

    int delay() const {
        return policy_->execution_delay_days;
    }

    /**
     * @brief Check that intent is well formed
     * @param intent Per-asset intent series
     * @param signal_type DISCRETE requires values in {-1, 0, +1}
     * @return ALIGNMENT_ERROR when series do not share one index,
     *         INTENT_VALIDATION_ERROR for out-of-range or non-finite values
     */
    Result<void> validate_intent(const Intent& intent, SignalType signal_type) const;

    /**
     * @brief Check that every object is indexed exactly by the reference
     *
     * Accepts TimeIndex, Series and Frame arguments. Nothing is reindexed.
     * @return ALIGNMENT_ERROR with missing/extra counts and the first
     *         offending timestamp
     */
    template <typename... Objects>
    Result<void> validate_alignment(const TimeIndex& reference, const Objects&... objects) const {
        return validate_alignment_all(reference, {index_of(objects)...});
    }

    Result<void> validate_alignment_all(const TimeIndex& reference,
                                        const std::vector<TimeIndex>& indices) const;

    /**
     * @brief Realized per-asset returns of an intent
     *
     * Maps exposure if a mapper is given, delays the result once and
     * multiplies by the concurrent raw returns.
     * @param intent Per-asset intent at decision time
     * @param raw_returns Per-asset returns with the same keys and index
     * @param mapper Optional cross-sectional exposure mapping
     */
    Result<SeriesMap> compute_meta_raw_returns(const Intent& intent, const SeriesMap& raw_returns,
                                               const ExposureMapper* mapper = nullptr) const;

    /**
     * @brief Shift a series forward by execution_delay_days
     * Leading values are zero.
     */
    Result<Series> apply_delay(const Series& series) const;

    /**
     * @brief Shift every column of a frame forward by execution_delay_days
     * Leading rows are zero.
     */
    Result<Frame> apply_delay(const Frame& frame) const;

    /**
     * @brief Streaming form of apply_delay for the step loop
     */
    DelayLine make_delay_line(size_t width) const;

private:
    static const TimeIndex& index_of(const TimeIndex& index) {
        return index;
    }
    static const TimeIndex& index_of(const Series& series) {
        return series.index;
    }
    static const TimeIndex& index_of(const Frame& frame) {
        return frame.index();
    }

    void warn_same_bar() const;

    std::shared_ptr<const ExecutionPolicy> policy_;
};

}  // namespace tempo_ngin
