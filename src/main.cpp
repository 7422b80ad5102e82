/**
 * @file main.cpp
 * @brief Entry point for the devui CLI
 *
 * Commands:
 * - ui:start:       Reuse or start the Developer UI server (DevServerSupervisor)
 * - ui:stop:        Ask the recorded server to quit and forget it
 * - start:          Run a user app and wait for its runtime to register (AppRunner)
 * - server-harness: Serve the Developer UI; this is what ui:start spawns
 *
 * Components:
 * - ProjectConfig: Finds the project root and .devui state paths
 * - Logger: Console lines plus .devui/devui-cli.log
 * - ServerRegistry: tools.json record of the running server
 * - HttpHealthChecker / CprHttpClient: HTTP probes
 * - PosixProcessLauncher: fork/exec of children
 * - FileRuntimeRegistry: runtimes announced by user apps
 */

#include <iostream>
#include <memory>

#include "devui/arg_parser.hpp"
#include "devui/project_config.hpp"
#include "devui/logger.hpp"
#include "devui/runtime_identity.hpp"
#include "devui/server_registry.hpp"
#include "devui/http_client.hpp"
#include "devui/health_checker.hpp"
#include "devui/process.hpp"
#include "devui/port_allocator.hpp"
#include "devui/browser_opener.hpp"
#include "devui/dev_server_supervisor.hpp"
#include "devui/runtime_registry.hpp"
#include "devui/app_runner.hpp"
#include "devui/server_harness.hpp"

using namespace devui;

/**
 * @brief Run ui:start
 *
 * @return int 0 when a server is running afterwards, 1 otherwise
 */
int run_ui_start(const ParsedArgs& args, const ProjectConfig& project, Logger& logger,
                 const ProcessSnapshot& snapshot) {
    ServerRegistry registry(project.get_tools_info_path());
    CprHttpClient http_client;
    HttpHealthChecker health_checker(http_client);
    PosixProcessLauncher launcher;
    SocketPortAllocator ports;
    SystemBrowserOpener browser;

    DevServerSupervisor supervisor(logger, registry, health_checker, http_client,
                                   launcher, ports, browser,
                                   [&snapshot] { return identify_runtime(snapshot); },
                                   project.get_server_log_path());

    StartOptions options;
    options.port = args.port;
    options.open = args.open;

    StartResult result = supervisor.start(options);
    return result.ok() ? 0 : 1;
}

int run_ui_stop(const ProjectConfig& project, Logger& logger) {
    ServerRegistry registry(project.get_tools_info_path());
    CprHttpClient http_client;
    HttpHealthChecker health_checker(http_client);
    return stop_dev_server(logger, registry, health_checker, http_client) ? 0 : 1;
}

int run_start(const ParsedArgs& args, const ProjectConfig& project, Logger& logger) {
    CprHttpClient http_client;
    HttpHealthChecker health_checker(http_client);
    PosixProcessLauncher launcher;

    project.ensure_dirs();
    FileRuntimeRegistry registry(project.get_runtimes_dir(), health_checker, logger);
    registry.start();

    AppRunOptions options;
    options.command = args.app_command.empty() ? args.positional_args : args.app_command;
    if (args.timeout) {
        options.timeout = *args.timeout;
    }

    AppRunner runner(logger, launcher, registry, project.get_runtimes_dir());
    int code = runner.run(options);
    registry.stop();
    return code;
}

int run_server_harness_command(const ParsedArgs& args, const ProjectConfig& project, Logger& logger) {
    if (args.positional_args.size() < 2) {
        logger.error("Usage: devui server-harness <port> <logPath>");
        return 1;
    }

    std::optional<int> port = ArgParser::parse_port(args.positional_args[0]);
    if (!port) {
        logger.error("\"" + args.positional_args[0] + "\" is not a valid port number");
        return 1;
    }

    HarnessOptions options;
    options.port = *port;
    options.log_path = args.positional_args[1];
    options.runtimes_dir = project.get_runtimes_dir();
    return run_server_harness(options);
}

/**
 * @brief Main entry point
 *
 * Parses command-line arguments and dispatches to the command.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @return int Exit code (0 for success)
 */
int main(int argc, char* argv[]) {
    ParsedArgs args = ArgParser::parse(argc, argv);

    if (args.show_help) {
        std::cout << ArgParser::get_help_message() << std::endl;
        return 0;
    }

    if (args.show_version) {
        std::cout << ArgParser::get_version_string() << std::endl;
        return 0;
    }

    if (args.command == Command::NONE || args.command == Command::UNKNOWN) {
        if (args.command == Command::UNKNOWN) {
            std::cerr << "Unknown command: " << args.command_name << std::endl;
        }
        std::cout << ArgParser::get_help_message() << std::endl;
        return 1;
    }

    try {
        ProjectConfig project = ProjectConfig::discover();

        // The harness keeps its own log; its console is /dev/null anyway
        if (args.command == Command::SERVER_HARNESS) {
            Logger logger;
            for (const auto& error : args.errors) {
                logger.error(error);
            }
            return args.errors.empty() ? run_server_harness_command(args, project, logger) : 1;
        }

        Logger logger(project.get_cli_log_path());
        logger.set_console_debug(args.debug);

        if (!args.errors.empty()) {
            for (const auto& error : args.errors) {
                logger.error(error);
            }
            return 1;
        }

        switch (args.command) {
            case Command::UI_START: {
                ProcessSnapshot snapshot = capture_current_process(argc, argv);
                return run_ui_start(args, project, logger, snapshot);
            }

            case Command::UI_STOP:
                return run_ui_stop(project, logger);

            case Command::START:
                return run_start(args, project, logger);

            default:
                return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
