// include/tempo_ngin/allocation/allocator.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "tempo_ngin/allocation/allocator_config.hpp"
#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/core/types.hpp"

namespace tempo_ngin {

/**
 * @brief Trailing asset returns handed to an allocator at one rebalance
 *
 * Every observation must be dated strictly before as_of.
 */
struct ReturnsWindow {
    std::vector<Timestamp> timestamps;
    std::vector<WeightVector> rows;  // One row per timestamp, one value per asset
    Timestamp as_of;
};

/**
 * @brief Group limit resolved to asset positions
 */
struct GroupLimit {
    std::string name;
    std::vector<size_t> members;
    double max_weight{1.0};
};

/**
 * @brief Constraints every allocator output must satisfy
 */
struct AllocationConstraints {
    WeightVector caps;    // Per-asset upper bounds
    double gross_target{1.0};  // Weights sum to this
    std::vector<GroupLimit> groups;

    /**
     * @brief Constraints for a universe from an allocator configuration
     * @return INVALID_CONFIG when a group names an unknown symbol or the
     *         gross target is infeasible under the caps
     */
    static Result<AllocationConstraints> from_config(const AllocatorConfig& config,
                                                     const std::vector<std::string>& symbols);
};

/**
 * @brief Weights and provenance of one allocation
 */
struct AllocationResult {
    WeightVector weights;
    AllocatorType allocator_used{AllocatorType::EQUAL_WEIGHT};
    std::vector<std::string> warnings;  // One per failed link of the fallback chain
};

/**
 * @brief Contract-enforcing base of all weight construction algorithms
 *
 * compute_weights runs the concrete algorithm and verifies its output itself.
 * A failing algorithm or a contract breach hands the request to the next
 * allocator of the fallback chain. Only the last link failing is an error.
 */
class Allocator {
public:
    static constexpr double SUM_TOLERANCE = 1e-8;
    static constexpr double CAP_TOLERANCE = 1e-10;

    Allocator(AllocatorType type, AllocatorConfig config);
    virtual ~Allocator() = default;

    Allocator(const Allocator&) = delete;
    Allocator& operator=(const Allocator&) = delete;

    /**
     * @brief Compute contract-checked weights for one rebalance
     * @param window Trailing returns strictly before window.as_of
     * @param constraints Caps, gross target and group limits
     * @return LOOKAHEAD_VIOLATION for a window reaching as_of,
     *         ALLOCATOR_CONTRACT_VIOLATION when the whole chain fails
     */
    Result<AllocationResult> compute_weights(const ReturnsWindow& window,
                                             const AllocationConstraints& constraints) const;

    AllocatorType type() const {
        return type_;
    }

    /**
     * @brief Price observations needed before the first allocation
     */
    virtual size_t warmup_period() const;

    void set_fallback(std::shared_ptr<const Allocator> fallback) {
        fallback_ = std::move(fallback);
    }

    const Allocator* fallback() const {
        return fallback_.get();
    }

protected:
    /**
     * @brief The concrete algorithm; its output is not trusted
     */
    virtual Result<WeightVector> compute_raw_weights(
        const ReturnsWindow& window, const AllocationConstraints& constraints) const = 0;

    const AllocatorConfig& config() const {
        return config_;
    }

private:
    Result<void> check_window(const ReturnsWindow& window,
                              const AllocationConstraints& constraints) const;
    Result<void> check_contract(const WeightVector& weights,
                                const AllocationConstraints& constraints) const;

    AllocatorType type_;
    AllocatorConfig config_;
    std::shared_ptr<const Allocator> fallback_;
};

}  // namespace tempo_ngin
