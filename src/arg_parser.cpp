#include "devui/arg_parser.hpp"
#include <cctype>

namespace devui {

    namespace {

        bool is_unsigned_integer(const std::string& value) {
            if (value.empty() || value.size() > 9) {
                return false;
            }
            for (char c : value) {
                if (!std::isdigit(static_cast<unsigned char>(c))) {
                    return false;
                }
            }
            return true;
        }

    } // namespace

    std::optional<int> ArgParser::parse_port(const std::string& value) {
        if (!is_unsigned_integer(value)) {
            return std::nullopt;
        }
        int port = std::stoi(value);
        if (port > 65535) {
            return std::nullopt;
        }
        return port;
    }

    ParsedArgs ArgParser::parse(int argc, char* argv[]) {
        ParsedArgs args;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--") {
                for (++i; i < argc; ++i) {
                    args.app_command.push_back(argv[i]);
                }
                break;
            }

            if (arg == "--help" || arg == "-h") {
                args.show_help = true;
            } else if (arg == "--version" || arg == "-v") {
                args.show_version = true;
            } else if (arg == "--debug") {
                args.debug = true;
            } else if (arg == "--open" || arg == "-o") {
                args.open = true;
            } else if (arg == "--port" || arg == "-p") {
                if (i + 1 >= argc) {
                    args.errors.push_back("Option " + arg + " requires a value");
                    continue;
                }
                std::string value = argv[++i];
                args.port = parse_port(value);
                if (!args.port) {
                    args.errors.push_back("\"" + value + "\" is not a valid port number");
                }
            } else if (arg == "--timeout") {
                if (i + 1 >= argc) {
                    args.errors.push_back("Option --timeout requires a value");
                    continue;
                }
                std::string value = argv[++i];
                if (is_unsigned_integer(value) && std::stoi(value) > 0) {
                    args.timeout = std::chrono::milliseconds(std::stoi(value));
                } else {
                    args.errors.push_back("\"" + value + "\" is not a valid timeout");
                }
            } else if (arg.size() > 1 && arg[0] == '-') {
                args.errors.push_back("Unknown option: " + arg);
            } else if (args.command == Command::NONE) {
                args.command_name = arg;
                args.command = command_from_string(arg);
            } else {
                args.positional_args.push_back(arg);
            }
        }

        return args;
    }

    Command ArgParser::command_from_string(const std::string& name) {
        if (name == "ui:start") return Command::UI_START;
        if (name == "ui:stop") return Command::UI_STOP;
        if (name == "start") return Command::START;
        if (name == "server-harness") return Command::SERVER_HARNESS;
        return Command::UNKNOWN;
    }

    std::string ArgParser::command_to_string(Command command) {
        switch (command) {
            case Command::NONE:           return "";
            case Command::UI_START:       return "ui:start";
            case Command::UI_STOP:        return "ui:stop";
            case Command::START:          return "start";
            case Command::SERVER_HARNESS: return "server-harness";
            case Command::UNKNOWN:        return "unknown";
            default:                      return "unknown";
        }
    }

    std::string ArgParser::get_help_message() {
        return R"(devui - Developer UI supervisor

Usage: devui [--debug] <command> [OPTIONS]

Commands:
  ui:start               Start the Developer UI, or report the one already running
  ui:stop                Stop the Developer UI recorded for this project
  start -- <cmd> [args]  Run your app in dev mode and wait for it to register

Options:
  -p, --port <port>      ui:start: port to serve on (0 = any free port)
  -o, --open             ui:start: open the UI in the browser
  --timeout <ms>         start: registration timeout (default: 30000)
  --debug                Print debug output
  -h, --help             Show this help message
  -v, --version          Show version information

Examples:
  devui ui:start                   # Reuse or start on the first free port from 4000
  devui ui:start --port 4100 --open
  devui start -- node index.js     # Runs with DEVUI_ENV=dev
  devui ui:stop
)";
    }

    std::string ArgParser::get_version_string() {
        return std::string("devui version ") + DEVUI_VERSION;
    }

} // namespace devui
