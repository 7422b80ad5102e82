#include "devui/app_runner.hpp"
#include "devui/logger.hpp"
#include "devui/process.hpp"
#include "devui/runtime_registry.hpp"
#include "devui/registration_waiter.hpp"
#include "devui/spawn_config.hpp"

namespace devui {

    namespace {

        int exit_status_of(const ProcessExitError& e) {
            if (e.signal() != 0) {
                return 128 + e.signal();
            }
            return e.exit_code() > 0 ? e.exit_code() : 1;
        }

    } // namespace

    AppRunner::AppRunner(Logger& logger,
                         ProcessLauncher& launcher,
                         RuntimeRegistry& registry,
                         std::filesystem::path runtimes_dir)
        : logger_(logger)
        , launcher_(launcher)
        , registry_(registry)
        , runtimes_dir_(std::move(runtimes_dir)) {}

    int AppRunner::run(const AppRunOptions& options) {
        if (options.command.empty()) {
            logger_.error("No command given. Usage: devui start -- <command> [args...]");
            return 1;
        }

        SpawnConfig config;
        config.command = options.command.front();
        config.args.assign(options.command.begin() + 1, options.command.end());
        config.options.stdio = {StdioMode::INHERIT, StdioMode::INHERIT, StdioMode::INHERIT};
        config.options.env["DEVUI_ENV"] = "dev";
        config.options.env["DEVUI_RUNTIMES_DIR"] = runtimes_dir_.string();

        std::unique_ptr<Process> process;
        try {
            process = launcher_.launch(config);
        } catch (const SpawnError& e) {
            logger_.error(e.what());
            return 1;
        }

        std::string target_id = std::to_string(process->get_pid());
        logger_.debug("Waiting for runtime " + target_id + " to register");

        try {
            wait_for_registration(registry_, target_id, process->lifecycle(), options.timeout);
        } catch (const RegistrationTimeoutError& e) {
            logger_.error(e.what());
            logger_.debug("Terminating " + target_id + ": " + process->terminate());
            return 1;
        } catch (const ProcessExitError& e) {
            logger_.error(std::string("App exited before registering: ") + e.what());
            return 1;
        }

        std::optional<RuntimeInfo> runtime = registry_.get_by_id(target_id);
        std::string url = runtime ? runtime->reflection_server_url : "unknown";
        logger_.info("Runtime " + target_id + " registered at " + url);

        try {
            process->lifecycle().get();
        } catch (const ProcessExitError& e) {
            logger_.debug(e.what());
            return exit_status_of(e);
        }
        return 0;
    }

} // namespace devui
