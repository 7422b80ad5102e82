#include "devui/state_machine.hpp"

namespace devui {

    bool StateMachine::is_valid_transition(SupervisorState from, SupervisorState to) {
        switch (from) {
            case SupervisorState::CHECKING_EXISTING:
                return to == SupervisorState::HEALTHY_REUSE || to == SupervisorState::STARTING;

            case SupervisorState::STARTING:
                return to == SupervisorState::STARTED || to == SupervisorState::FAILED;

            // Terminal
            case SupervisorState::HEALTHY_REUSE:
            case SupervisorState::STARTED:
            case SupervisorState::FAILED:
                return false;

            default:
                return false;
        }
    }

    bool StateMachine::transition_to(SupervisorState new_state) {
        std::lock_guard<std::mutex> lock(mutex_);

        SupervisorState current = current_state_.load();

        if (!is_valid_transition(current, new_state)) {
            return false;
        }

        current_state_.store(new_state);
        return true;
    }

    void StateMachine::reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        current_state_.store(SupervisorState::CHECKING_EXISTING);
    }

    bool StateMachine::is_terminal() const {
        SupervisorState s = current_state_.load();
        return s == SupervisorState::HEALTHY_REUSE ||
               s == SupervisorState::STARTED ||
               s == SupervisorState::FAILED;
    }

} // namespace devui
