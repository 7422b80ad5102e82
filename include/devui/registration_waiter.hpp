/**
 * @file registration_waiter.hpp
 * @brief Waits for a launched application to register its runtime
 *
 * Three outcomes race:
 * - the target id is (or becomes) registered  → return
 * - the process lifecycle fails first         → rethrow its error
 * - the timeout elapses                        → RegistrationTimeoutError
 *
 * The registry subscription is dropped on every path.
 */

#pragma once

#include <string>
#include <chrono>
#include <future>
#include <stdexcept>

#include "devui/project_config.hpp"

namespace devui {

    class RuntimeRegistry;

    /**
     * @brief The target never registered within the timeout
     */
    class RegistrationTimeoutError : public std::runtime_error {
    public:
        RegistrationTimeoutError(const std::string& target_id, std::chrono::milliseconds timeout)
            : std::runtime_error("Timed out after " + std::to_string(timeout.count()) +
                                 "ms waiting for runtime " + target_id + " to register")
            , target_id_(target_id) {}

        [[nodiscard]] const std::string& target_id() const { return target_id_; }

    private:
        std::string target_id_;
    };

    /**
     * @brief Blocks until target_id is registered
     *
     * A lifecycle that completes normally (exit code 0) before
     * registration does not end the wait; only a failed lifecycle does.
     * An invalid lifecycle future is treated as never settling.
     *
     * @param registry Source of registrations
     * @param target_id Id the application is expected to register under
     * @param lifecycle Lifecycle of the launched process
     * @param timeout Hard limit for the whole wait
     * @throws RegistrationTimeoutError if time runs out
     * @throws whatever the lifecycle future holds (ProcessExitError) if the
     *         process fails before registering
     */
    void wait_for_registration(RuntimeRegistry& registry,
                               const std::string& target_id,
                               std::shared_future<void> lifecycle,
                               std::chrono::milliseconds timeout = kRegistrationTimeout);

} // namespace devui
