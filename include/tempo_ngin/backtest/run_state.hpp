// include/tempo_ngin/backtest/run_state.hpp
#pragma once

#include <string>
#include "tempo_ngin/core/error.hpp"

namespace tempo_ngin {

enum class RunState { INITIALIZED, WARMING_UP, STEPPING, FINALIZING, COMPLETE, FAILED };

std::string run_state_to_string(RunState state);

/**
 * @brief Lifecycle of one walk-forward run
 *
 * INITIALIZED -> WARMING_UP -> STEPPING -> FINALIZING -> COMPLETE, with
 * FAILED reachable from every non-terminal state. COMPLETE and FAILED are
 * terminal.
 */
class RunStateMachine {
public:
    RunState state() const {
        return state_;
    }

    Result<void> transition(RunState next);

    /**
     * @brief Move to FAILED and keep the reason
     */
    Result<void> fail(const std::string& reason);

    const std::string& failure_reason() const {
        return failure_reason_;
    }

    bool is_terminal() const {
        return state_ == RunState::COMPLETE || state_ == RunState::FAILED;
    }

private:
    Result<void> validate_transition(RunState current, RunState next) const;

    RunState state_{RunState::INITIALIZED};
    std::string failure_reason_;
};

}  // namespace tempo_ngin
