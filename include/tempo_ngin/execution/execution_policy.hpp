// include/tempo_ngin/execution/execution_policy.hpp
#pragma once

#include <memory>
#include <string>
#include "tempo_ngin/core/config_base.hpp"
#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/core/types.hpp"

namespace tempo_ngin {

/**
 * @brief When the decision is taken
 */
enum class SignalTime {
    CLOSE
};

/**
 * @brief When the decision is executed
 */
enum class ExecutionTime {
    NEXT_OPEN,
    NEXT_CLOSE
};

std::string execution_time_to_string(ExecutionTime time);

/**
 * @brief Execution timing of a run
 *
 * Validated once and shared as shared_ptr<const ExecutionPolicy>; never
 * mutated while a run is in progress.
 */
struct ExecutionPolicy : public ConfigBase {
    static constexpr int MAX_DELAY_DAYS = 10;

    SignalTime signal_time{SignalTime::CLOSE};
    ExecutionTime execution_time{ExecutionTime::NEXT_OPEN};
    PriceField price_used{PriceField::OPEN};
    int execution_delay_days{1};  // Trading steps between decision and execution

    std::string version{"1.0.0"};

    /**
     * @brief Delay range and execution time / price consistency
     */
    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Validate a policy and freeze it for sharing
 */
Result<std::shared_ptr<const ExecutionPolicy>> make_execution_policy(ExecutionPolicy policy);

}  // namespace tempo_ngin
