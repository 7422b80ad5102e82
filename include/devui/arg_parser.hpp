/**
 * @file arg_parser.hpp
 * @brief Command-line argument parser for devui
 *
 * Commands:
 * - ui:start [--port <n>] [--open]
 * - ui:stop
 * - start [--timeout <ms>] -- <command> [args...]
 * - server-harness <port> <logPath>   (internal)
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace devui {

    enum class Command {
        NONE,            // No command given
        UI_START,        // Start or reuse the Developer UI
        UI_STOP,         // Stop the recorded Developer UI
        START,           // Run a user app in dev mode
        SERVER_HARNESS,  // Internal: serve the Developer UI
        UNKNOWN          // Anything else
    };

    /**
     * @brief Parsed command-line arguments
     */
    struct ParsedArgs {
        Command command = Command::NONE;
        std::string command_name;                   // As typed
        std::vector<std::string> positional_args;   // After the command, before "--"
        std::vector<std::string> app_command;       // After "--"
        std::optional<int> port;
        std::optional<std::chrono::milliseconds> timeout;
        bool open = false;
        bool debug = false;
        bool show_help = false;
        bool show_version = false;
        std::vector<std::string> errors;            // One line per problem
    };

    /**
     * @brief Command-line argument parser
     *
     * Parses argc/argv and returns structured arguments. Never throws;
     * problems are collected in ParsedArgs::errors.
     */
    class ArgParser {
    public:
        static ParsedArgs parse(int argc, char* argv[]);

        /**
         * @brief Parses a port number
         *
         * @param value Text from the command line
         * @return std::optional<int> The port if value is an integer in [0, 65535]
         */
        static std::optional<int> parse_port(const std::string& value);

        static std::string get_help_message();

        static std::string get_version_string();

        static std::string command_to_string(Command command);

    private:
        static Command command_from_string(const std::string& name);
    };

} // namespace devui
