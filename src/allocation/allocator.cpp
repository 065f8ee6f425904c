#include "tempo_ngin/allocation/allocator.hpp"
#include <cmath>
#include <map>
#include "tempo_ngin/allocation/weight_utils.hpp"
#include "tempo_ngin/core/logger.hpp"
#include "tempo_ngin/core/time_utils.hpp"

namespace tempo_ngin {

Result<AllocationConstraints> AllocationConstraints::from_config(
    const AllocatorConfig& config, const std::vector<std::string>& symbols) {
    AllocationConstraints constraints;
    constraints.caps.assign(symbols.size(), config.per_asset_cap);
    constraints.gross_target = config.gross_exposure_cap;

    if (static_cast<double>(symbols.size()) * config.per_asset_cap <
        config.gross_exposure_cap - Allocator::SUM_TOLERANCE) {
        return make_error<AllocationConstraints>(
            ErrorCode::INVALID_CONFIG,
            "Gross target " + std::to_string(config.gross_exposure_cap) +
                " is infeasible with " + std::to_string(symbols.size()) +
                " assets capped at " + std::to_string(config.per_asset_cap),
            "AllocationConstraints");
    }

    std::map<std::string, size_t> positions;
    for (size_t i = 0; i < symbols.size(); ++i) {
        positions[symbols[i]] = i;
    }
    for (const auto& group : config.groups) {
        GroupLimit limit;
        limit.name = group.name;
        limit.max_weight = group.max_weight;
        for (const auto& member : group.members) {
            auto it = positions.find(member);
            if (it == positions.end()) {
                return make_error<AllocationConstraints>(
                    ErrorCode::INVALID_CONFIG,
                    "Group '" + group.name + "' names unknown asset '" + member + "'",
                    "AllocationConstraints");
            }
            limit.members.push_back(it->second);
        }
        constraints.groups.push_back(std::move(limit));
    }
    return constraints;
}

Allocator::Allocator(AllocatorType type, AllocatorConfig config)
    : type_(type), config_(std::move(config)) {
    Logger::register_component("Allocator");
}

size_t Allocator::warmup_period() const {
    // lookback returns need lookback + 1 prices
    return config_.lookback + 1;
}

Result<void> Allocator::check_window(const ReturnsWindow& window,
                                     const AllocationConstraints& constraints) const {
    if (window.timestamps.size() != window.rows.size()) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Returns window has " + std::to_string(window.rows.size()) +
                                    " rows for " + std::to_string(window.timestamps.size()) +
                                    " timestamps",
                                "Allocator");
    }
    for (size_t t = 0; t < window.rows.size(); ++t) {
        if (window.timestamps[t] >= window.as_of) {
            return make_error<void>(ErrorCode::LOOKAHEAD_VIOLATION,
                                    "Returns window observation dated " +
                                        core::format_date(window.timestamps[t]) +
                                        " is not before the rebalance date " +
                                        core::format_date(window.as_of),
                                    "Allocator");
        }
        if (t > 0 && !(window.timestamps[t - 1] < window.timestamps[t])) {
            return make_error<void>(ErrorCode::ALIGNMENT_ERROR,
                                    "Returns window timestamps are not strictly increasing",
                                    "Allocator");
        }
        if (window.rows[t].size() != constraints.caps.size()) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Returns window row width does not match the universe",
                                    "Allocator");
        }
    }
    return Result<void>();
}

Result<void> Allocator::check_contract(const WeightVector& weights,
                                       const AllocationConstraints& constraints) const {
    if (weights.size() != constraints.caps.size()) {
        return make_error<void>(ErrorCode::ALLOCATOR_CONTRACT_VIOLATION,
                                "returned " + std::to_string(weights.size()) + " weights for " +
                                    std::to_string(constraints.caps.size()) + " assets",
                                "Allocator");
    }
    for (size_t i = 0; i < weights.size(); ++i) {
        if (!std::isfinite(weights[i])) {
            return make_error<void>(ErrorCode::ALLOCATOR_CONTRACT_VIOLATION,
                                    "non-finite weight for asset " + std::to_string(i),
                                    "Allocator");
        }
        if (weights[i] < -CAP_TOLERANCE || weights[i] > constraints.caps[i] + CAP_TOLERANCE) {
            return make_error<void>(ErrorCode::ALLOCATOR_CONTRACT_VIOLATION,
                                    "weight " + std::to_string(weights[i]) + " of asset " +
                                        std::to_string(i) + " outside [0, " +
                                        std::to_string(constraints.caps[i]) + "]",
                                    "Allocator");
        }
    }
    double total = weights::sum(weights);
    if (std::abs(total - constraints.gross_target) > SUM_TOLERANCE) {
        return make_error<void>(ErrorCode::ALLOCATOR_CONTRACT_VIOLATION,
                                "weights sum to " + std::to_string(total) + ", expected " +
                                    std::to_string(constraints.gross_target),
                                "Allocator");
    }
    return Result<void>();
}

Result<AllocationResult> Allocator::compute_weights(
    const ReturnsWindow& window, const AllocationConstraints& constraints) const {
    auto window_check = check_window(window, constraints);
    if (window_check.is_error()) {
        ERROR(window_check.error()->to_string());
        return forward_error<AllocationResult>(window_check.error());
    }

    std::string failure;
    auto raw = compute_raw_weights(window, constraints);
    if (raw.is_ok()) {
        auto contract = check_contract(raw.value(), constraints);
        if (contract.is_ok()) {
            AllocationResult result;
            result.weights = raw.take();
            result.allocator_used = type_;
            return result;
        }
        failure = contract.error()->what();
    } else {
        failure = raw.error()->what();
    }

    if (!fallback_) {
        return make_error<AllocationResult>(
            ErrorCode::ALLOCATOR_CONTRACT_VIOLATION,
            "Final fallback " + allocator_type_to_string(type_) + " failed: " + failure,
            "Allocator");
    }

    std::string warning = allocator_type_to_string(type_) + " failed (" + failure +
                          "), falling back to " + allocator_type_to_string(fallback_->type());
    WARN(warning);

    auto next = fallback_->compute_weights(window, constraints);
    if (next.is_error()) {
        return forward_error<AllocationResult>(next.error());
    }
    AllocationResult result = next.take();
    result.warnings.insert(result.warnings.begin(), warning);
    return result;
}

}  // namespace tempo_ngin
