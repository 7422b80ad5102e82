/**
 * @file app_runner.hpp
 * @brief `devui start -- <command>`: runs a user app in dev mode
 *
 * The app is launched with DEVUI_ENV=dev and DEVUI_RUNTIMES_DIR set,
 * inherits the terminal, and is expected to write its runtime file under
 * its own PID. Once registered, the runner waits for the app to exit and
 * passes its exit code through.
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>

#include "devui/project_config.hpp"

namespace devui {

    class Logger;
    class ProcessLauncher;
    class RuntimeRegistry;

    struct AppRunOptions {
        std::vector<std::string> command;                         ///< Program and its arguments
        std::chrono::milliseconds timeout = kRegistrationTimeout; ///< Registration wait
    };

    class AppRunner {
    public:
        AppRunner(Logger& logger,
                  ProcessLauncher& launcher,
                  RuntimeRegistry& registry,
                  std::filesystem::path runtimes_dir);

        /**
         * @brief Launches the app, waits for registration, then for exit
         *
         * @return int The app's exit code; 1 if it could not be launched,
         *         failed before registering or never registered; 128+N
         *         if killed by signal N
         */
        int run(const AppRunOptions& options);

    private:
        Logger& logger_;
        ProcessLauncher& launcher_;
        RuntimeRegistry& registry_;
        std::filesystem::path runtimes_dir_;
    };

} // namespace devui
