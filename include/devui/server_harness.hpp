/**
 * @file server_harness.hpp
 * @brief Body of `devui server-harness <port> <logPath>`
 *
 * Runs in the child spawned by `ui:start`. Serves the Developer UI
 * routes until a quit request, SIGINT or SIGTERM, and writes a session
 * log with a header and a teardown footer.
 */

#pragma once

#include <string>
#include <filesystem>

namespace devui {

    class Logger;

    struct HarnessOptions {
        int port = 0;
        std::filesystem::path log_path;       ///< Session log
        std::filesystem::path runtimes_dir;   ///< Watched for user runtimes
    };

    /**
     * @brief Serves until asked to stop
     *
     * @return int 0 on clean shutdown, 1 if the port could not be bound
     */
    int run_server_harness(const HarnessOptions& options);

    void write_session_header(Logger& log, int port);

    void write_session_footer(Logger& log, const std::string& shutdown_reason);

} // namespace devui
