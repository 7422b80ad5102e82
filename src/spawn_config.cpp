#include "devui/spawn_config.hpp"
#include "devui/utils.hpp"
#include <cmath>
#include <sstream>
#include <unistd.h>

namespace devui {

    namespace {

        std::string format_port(double port) {
            if (std::isnan(port)) {
                return "NaN";
            }
            if (std::isinf(port)) {
                return port > 0 ? "Infinity" : "-Infinity";
            }
            std::ostringstream ss;
            ss << port;
            return ss.str();
        }

        void validate_port(double port) {
            bool valid = !std::isnan(port) &&
                         std::floor(port) == port &&
                         port >= 0 && port <= 65535;
            if (!valid) {
                throw SpawnConfigError("Invalid port number: " + format_port(port) +
                                       ". Must be between 0 and 65535");
            }
        }

    } // namespace

    std::string quote_for_shell(const std::string& token) {
        return "\"" + token + "\"";
    }

    SpawnConfig build_server_harness_spawn_config(const RuntimeIdentity& identity,
                                                  double port,
                                                  const std::string& log_path) {
        if (trim(identity.executable_path).empty()) {
            throw SpawnConfigError("CLI runtime execPath is required");
        }
        validate_port(port);
        if (log_path.empty()) {
            throw SpawnConfigError("Log path is required");
        }

        std::vector<std::string> args = {
            kServerHarnessCommand,
            std::to_string(static_cast<int>(port)),
            log_path
        };

        // A compiled binary is its own entry point
        if (!identity.is_compiled_binary() && identity.script_path) {
            args.insert(args.begin(), *identity.script_path);
        }

        SpawnConfig config;
        config.command = identity.executable_path;
        config.args = std::move(args);
        config.options.detached = false;
        config.options.stdio = {StdioMode::IGNORE, StdioMode::IGNORE, StdioMode::IGNORE};

        if (identity.platform_family == PlatformFamily::WINDOWS) {
            config.command = quote_for_shell(config.command);
            for (auto& arg : config.args) {
                arg = quote_for_shell(arg);
            }
            config.options.use_shell = true;
        } else {
            config.options.use_shell = false;
        }

        return config;
    }

    SpawnConfig build_server_harness_spawn_config(const std::optional<RuntimeIdentity>& identity,
                                                  double port,
                                                  const std::string& log_path) {
        if (!identity) {
            throw SpawnConfigError("CLI runtime info is required");
        }
        return build_server_harness_spawn_config(*identity, port, log_path);
    }

    bool validate_executable_path(const std::string& path) noexcept {
        if (path.empty()) {
            return false;
        }
        return access(path.c_str(), F_OK | X_OK) == 0;
    }

} // namespace devui
