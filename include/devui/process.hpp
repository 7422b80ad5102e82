/**
 * @file process.hpp
 * @brief Child process creation and lifecycle tracking
 *
 * This header provides functionality to:
 * - Spawn a child from a SpawnConfig (fork/execve, or /bin/sh -c when
 *   use_shell is set)
 * - Report exec failures (ENOENT, EACCES, ...) synchronously as SpawnError
 * - Expose the child's lifetime as a shared_future that resolves on exit
 *   code 0 and carries a ProcessExitError otherwise
 * - Terminate gracefully (SIGTERM, 5 s) or forcefully (SIGKILL)
 *
 * Process lifecycle:
 * 1. launch()     - fork, apply stdio/env, exec
 * 2. lifecycle()  - reaper thread blocks in waitpid() and settles the future
 * 3. terminate()  - SIGTERM with 5s timeout, then SIGKILL
 * 4. release()    - stop managing; the child outlives the handle
 */

#pragma once

#include <array>
#include <string>
#include <memory>
#include <future>
#include <optional>
#include <stdexcept>
#include <sys/types.h>

#include "devui/spawn_config.hpp"

namespace devui {

    /**
     * @brief The OS refused to create or exec the child
     */
    class SpawnError : public std::runtime_error {
    public:
        SpawnError(const std::string& message, int error_code)
            : std::runtime_error(message), error_code_(error_code) {}

        /// errno reported by fork/exec
        [[nodiscard]] int error_code() const { return error_code_; }

    private:
        int error_code_;
    };

    /**
     * @brief The child exited with a non-zero status or was killed by a signal
     */
    class ProcessExitError : public std::runtime_error {
    public:
        ProcessExitError(const std::string& message, int exit_code, int signal)
            : std::runtime_error(message), exit_code_(exit_code), signal_(signal) {}

        /// Exit status, or -1 if terminated by a signal
        [[nodiscard]] int exit_code() const { return exit_code_; }

        /// Terminating signal, or 0
        [[nodiscard]] int signal() const { return signal_; }

    private:
        int exit_code_;
        int signal_;
    };

    /**
     * @brief Handle to a running child
     *
     * Destroying a handle that has not been released terminates the child.
     */
    class Process {
    public:
        virtual ~Process() = default;

        [[nodiscard]] virtual pid_t get_pid() const = 0;

        /**
         * @brief True until the child has been reaped
         */
        virtual bool is_alive() const = 0;

        /**
         * @brief Resolves on exit code 0, rejects with ProcessExitError otherwise
         */
        [[nodiscard]] virtual std::shared_future<void> lifecycle() const = 0;

        /**
         * @brief Stops the child
         *
         * @return std::string "Graceful termination", "Force killed" or "Not running"
         */
        virtual std::string terminate() = 0;

        /**
         * @brief Detaches the handle; the child keeps running after destruction
         */
        virtual void release() = 0;

        /**
         * @brief Parent end of a PIPE stdio slot, or -1
         *
         * @param index 0 = stdin (write end), 1 = stdout, 2 = stderr (read ends)
         */
        [[nodiscard]] virtual int stdio_fd(int index) const = 0;
    };

    /**
     * @brief Creates child processes
     */
    class ProcessLauncher {
    public:
        virtual ~ProcessLauncher() = default;

        /**
         * @brief Spawns the process described by config
         *
         * @throws SpawnError if the child cannot be created or exec fails
         */
        virtual std::unique_ptr<Process> launch(const SpawnConfig& config) = 0;
    };

    /**
     * @brief fork/execve implementation of ProcessLauncher
     */
    class PosixProcessLauncher : public ProcessLauncher {
    public:
        std::unique_ptr<Process> launch(const SpawnConfig& config) override;

        /**
         * @brief Resolves a bare command name against PATH
         *
         * Names containing '/' are returned unchanged; unresolvable names
         * are returned unchanged so exec reports ENOENT.
         */
        static std::string resolve_command(const std::string& command);
    };

} // namespace devui
