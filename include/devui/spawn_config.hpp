/**
 * @file spawn_config.hpp
 * @brief Builds the command line that re-launches devui as the server harness
 *
 * The builder is a pure function: no I/O, no environment lookups. All of
 * the platform asymmetry lives here:
 *
 *   posix:   execv(command, [args...])              tokens untouched
 *   windows: shell re-tokenizes the command line    every token "quoted"
 *
 * validate_executable_path() is the pre-flight gate run before spawning.
 */

#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <stdexcept>

#include "devui/runtime_identity.hpp"

namespace devui {

    /// Sub-command the child runs: `devui server-harness <port> <logPath>`
    constexpr const char* kServerHarnessCommand = "server-harness";

    /**
     * @brief What happens to one of the child's standard streams
     */
    enum class StdioMode {
        IGNORE,     ///< Redirected to /dev/null
        PIPE,       ///< Connected to a pipe owned by the parent
        INHERIT     ///< Shares the parent's stream
    };

    /**
     * @brief How to create the child process
     *
     * stdio order is stdin, stdout, stderr.
     */
    struct SpawnOptions {
        bool use_shell = false;
        bool detached = false;
        std::array<StdioMode, 3> stdio{StdioMode::IGNORE, StdioMode::IGNORE, StdioMode::IGNORE};
        std::map<std::string, std::string> env;   ///< Added to the inherited environment
    };

    /**
     * @brief Ready-to-execute invocation
     */
    struct SpawnConfig {
        std::string command;
        std::vector<std::string> args;
        SpawnOptions options;
    };

    /**
     * @brief Thrown for invalid builder input (programming/configuration error)
     */
    class SpawnConfigError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /**
     * @brief Wraps a token in one pair of double quotes
     */
    std::string quote_for_shell(const std::string& token);

    /**
     * @brief Builds the server-harness invocation for a runtime
     *
     * Arguments: [script_path?] server-harness <port> <log_path>
     *
     * The port is taken as a double so fractional and NaN values coming
     * from loosely typed callers are rejected here rather than truncated.
     *
     * @param identity Runtime to re-launch (executable_path must be non-empty)
     * @param port Integer in [0, 65535]
     * @param log_path File the harness logs to (non-empty)
     * @return SpawnConfig with all stdio ignored and detached = false
     *
     * @throws SpawnConfigError "CLI runtime execPath is required",
     *         "Invalid port number: <p>. Must be between 0 and 65535",
     *         "Log path is required"
     */
    SpawnConfig build_server_harness_spawn_config(const RuntimeIdentity& identity,
                                                  double port,
                                                  const std::string& log_path);

    /**
     * @brief Same as above for callers holding an optional identity
     *
     * @throws SpawnConfigError "CLI runtime info is required" when empty
     */
    SpawnConfig build_server_harness_spawn_config(const std::optional<RuntimeIdentity>& identity,
                                                  double port,
                                                  const std::string& log_path);

    /**
     * @brief Checks that path exists and is executable
     *
     * Never throws; any failure (missing, no permission, I/O error) is false.
     */
    bool validate_executable_path(const std::string& path) noexcept;

} // namespace devui
