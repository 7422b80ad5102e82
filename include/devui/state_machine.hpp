/**
 * @file state_machine.hpp
 * @brief States of one `ui:start` run
 *
 * CHECKING_EXISTING → HEALTHY_REUSE
 *        |
 *        └──────────→ STARTING → STARTED
 *                          |
 *                          └──→ FAILED
 *
 * HEALTHY_REUSE, STARTED and FAILED are terminal.
 */

#pragma once

#include <mutex>
#include <atomic>
#include <string>

namespace devui {

    /**
     * @brief Supervisor states
     */
    enum class SupervisorState {
        CHECKING_EXISTING,  ///< Reading the registry and probing the recorded URL
        HEALTHY_REUSE,      ///< Recorded server answered; nothing spawned
        STARTING,           ///< Spawning and health-checking a new server
        STARTED,            ///< New server is healthy
        FAILED              ///< Any start failure
    };

    inline std::string state_to_string(SupervisorState state) {
        switch (state) {
            case SupervisorState::CHECKING_EXISTING: return "CHECKING_EXISTING";
            case SupervisorState::HEALTHY_REUSE:     return "HEALTHY_REUSE";
            case SupervisorState::STARTING:          return "STARTING";
            case SupervisorState::STARTED:           return "STARTED";
            case SupervisorState::FAILED:            return "FAILED";
            default:                                 return "UNKNOWN";
        }
    }

    /**
     * @brief Thread-safe supervisor state holder
     *
     * Usage:
     *   StateMachine sm;                          // CHECKING_EXISTING
     *   sm.transition_to(SupervisorState::STARTING);
     *   if (sm.is_terminal()) { ... }
     */
    class StateMachine {
    public:
        StateMachine() : current_state_(SupervisorState::CHECKING_EXISTING) {}

        SupervisorState get_state() const {
            return current_state_.load();
        }

        /**
         * @brief Attempts to transition to a new state
         *
         * Valid transitions:
         * - CHECKING_EXISTING → HEALTHY_REUSE (recorded server healthy)
         * - CHECKING_EXISTING → STARTING (no record, or probe failed)
         * - STARTING → STARTED (health check passed)
         * - STARTING → FAILED (validation, spawn or health failure)
         *
         * @param new_state The desired new state
         * @return true if transition was successful
         * @return false if transition is invalid
         */
        bool transition_to(SupervisorState new_state);

        /**
         * @brief True for HEALTHY_REUSE, STARTED and FAILED
         */
        [[nodiscard]] bool is_terminal() const;

        /**
         * @brief Returns to CHECKING_EXISTING for a new run
         */
        void reset();

        static bool is_valid_transition(SupervisorState from, SupervisorState to);

    private:
        std::atomic<SupervisorState> current_state_;
        mutable std::mutex mutex_;
    };

} // namespace devui
