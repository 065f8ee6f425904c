#include "tempo_ngin/backtest/run_state.hpp"

namespace tempo_ngin {

std::string run_state_to_string(RunState state) {
    switch (state) {
        case RunState::INITIALIZED:
            return "INITIALIZED";
        case RunState::WARMING_UP:
            return "WARMING_UP";
        case RunState::STEPPING:
            return "STEPPING";
        case RunState::FINALIZING:
            return "FINALIZING";
        case RunState::COMPLETE:
            return "COMPLETE";
        case RunState::FAILED:
            return "FAILED";
        default:
            return "UNKNOWN";
    }
}

Result<void> RunStateMachine::validate_transition(RunState current, RunState next) const {
    bool valid = false;
    switch (current) {
        case RunState::INITIALIZED:
            valid = (next == RunState::WARMING_UP || next == RunState::FAILED);
            break;
        case RunState::WARMING_UP:
            valid = (next == RunState::STEPPING || next == RunState::FAILED);
            break;
        case RunState::STEPPING:
            valid = (next == RunState::FINALIZING || next == RunState::FAILED);
            break;
        case RunState::FINALIZING:
            valid = (next == RunState::COMPLETE || next == RunState::FAILED);
            break;
        case RunState::COMPLETE:
        case RunState::FAILED:
            valid = false;
            break;
    }

    if (!valid) {
        return make_error<void>(ErrorCode::INVALID_STATE,
                                "Invalid state transition " + run_state_to_string(current) +
                                    " -> " + run_state_to_string(next),
                                "RunStateMachine");
    }
    return Result<void>();
}

Result<void> RunStateMachine::transition(RunState next) {
    auto valid = validate_transition(state_, next);
    if (valid.is_error()) {
        return valid;
    }
    state_ = next;
    return Result<void>();
}

Result<void> RunStateMachine::fail(const std::string& reason) {
    auto valid = transition(RunState::FAILED);
    if (valid.is_error()) {
        return valid;
    }
    failure_reason_ = reason;
    return Result<void>();
}

}  // namespace tempo_ngin
