#include "devui/dev_server_supervisor.hpp"
#include "devui/server_registry.hpp"
#include "devui/health_checker.hpp"
#include "devui/http_client.hpp"
#include "devui/process.hpp"
#include "devui/port_allocator.hpp"
#include "devui/browser_opener.hpp"
#include "devui/spawn_config.hpp"
#include "devui/best_effort.hpp"
#include "devui/utils.hpp"

namespace devui {

    DevServerSupervisor::DevServerSupervisor(Logger& logger,
                                             ServerRegistry& registry,
                                             HealthChecker& health_checker,
                                             HttpClient& http_client,
                                             ProcessLauncher& launcher,
                                             PortAllocator& port_allocator,
                                             BrowserOpener& browser,
                                             IdentityProvider identity_provider,
                                             std::filesystem::path server_log_path,
                                             ExecutableValidator validator,
                                             std::chrono::milliseconds health_timeout)
        : logger_(logger)
        , registry_(registry)
        , health_checker_(health_checker)
        , http_client_(http_client)
        , launcher_(launcher)
        , port_allocator_(port_allocator)
        , browser_(browser)
        , identity_provider_(std::move(identity_provider))
        , server_log_path_(std::move(server_log_path))
        , validator_(validator ? std::move(validator) : ExecutableValidator(validate_executable_path))
        , health_timeout_(health_timeout) {}

    StartResult DevServerSupervisor::start(const StartOptions& options) {
        state_machine_.reset();

        StartResult result;
        if (try_reuse(result)) {
            return result;
        }

        enter(SupervisorState::STARTING);
        logger_.info("Starting...");
        return launch_new(options);
    }

    bool DevServerSupervisor::try_reuse(StartResult& result) {
        std::optional<ServerRegistryRecord> record = registry_.read();
        if (!record) {
            logger_.debug("No UI running. Starting a new one...");
            return false;
        }

        if (!health_checker_.check(record->url, kReuseProbeTimeout)) {
            logger_.debug("Found UI server metadata but server is not healthy. Starting a new one...");
            return false;
        }

        enter(SupervisorState::HEALTHY_REUSE);
        logger_.info("Developer UI is already running at: " + record->url);
        logger_.info("To stop the UI, run `devui ui:stop`.");

        result.state = SupervisorState::HEALTHY_REUSE;
        result.url = record->url;
        return true;
    }

    StartResult DevServerSupervisor::launch_new(const StartOptions& options) {
        RuntimeIdentity identity;
        SpawnConfig config;
        int port = 0;

        // Configuration errors are not normalized
        try {
            identity = identity_provider_();
            logger_.debug("Detected CLI runtime: " + runtime_kind_to_string(identity.kind) +
                          " at " + identity.executable_path +
                          " (" + platform_family_to_string(identity.platform_family) + ")");
            if (identity.script_path) {
                logger_.debug("Script path: " + *identity.script_path);
            }

            port = port_allocator_.allocate(options.port);
            config = build_server_harness_spawn_config(identity, port, server_log_path_.string());
        } catch (const SpawnConfigError&) {
            enter(SupervisorState::FAILED);
            throw;
        } catch (const RuntimeDetectionError&) {
            enter(SupervisorState::FAILED);
            throw;
        } catch (const std::exception& e) {
            return fail(std::string("Could not prepare server launch: ") + e.what());
        }

        if (!validator_(identity.executable_path)) {
            return fail("Executable is missing or not executable: " + identity.executable_path);
        }

        std::vector<std::string> command_line = {config.command};
        command_line.insert(command_line.end(), config.args.begin(), config.args.end());
        logger_.debug("Spawning: " + join(command_line));

        std::unique_ptr<Process> process;
        try {
            process = launcher_.launch(config);
        } catch (const std::exception& e) {
            return fail(std::string("Spawn failed: ") + e.what());
        }

        std::string url = "http://localhost:" + std::to_string(port);
        Process* child = process.get();

        bool healthy = false;
        try {
            healthy = health_checker_.wait_until_healthy(url, health_timeout_,
                                                         [child] { return !child->is_alive(); });
        } catch (const std::exception& e) {
            logger_.debug(std::string("Health check error: ") + e.what());
        }

        if (!healthy) {
            std::string how = process->terminate();
            logger_.debug("Server process " + std::to_string(process->get_pid()) + ": " + how);
            return fail("Health check failed for " + url);
        }

        // The server now lives independently of this command
        process->release();
        enter(SupervisorState::STARTED);

        after_start(url, options.open);

        StartResult result;
        result.state = SupervisorState::STARTED;
        result.url = url;
        return result;
    }

    void DevServerSupervisor::after_start(const std::string& url, bool open_browser) {
        bool persisted = attempt(logger_, LogLevel::DEBUG, "Metadata write failed", [&] {
            registry_.write(ServerRegistryRecord{url, iso8601_now()});
        });
        if (persisted) {
            logger_.debug("UI server metadata written to " + registry_.get_record_path().string());
        } else {
            logger_.warn("Failed to write UI server metadata. UI server will continue to run.");
        }

        logger_.info("Developer UI started at: " + url);
        logger_.info("To stop the UI, run `devui ui:stop`.");

        if (open_browser) {
            attempt(logger_, LogLevel::DEBUG, "Failed to open browser", [&] {
                browser_.open(url);
            });
        }

        bool has_content = attempt(logger_, LogLevel::DEBUG, "Content probe failed", [&] {
            HttpResponse response = http_client_.get(url + kContentProbePath, kReuseProbeTimeout);
            if (!response.ok()) {
                throw std::runtime_error(response.error.empty()
                                             ? "status " + std::to_string(response.status_code)
                                             : response.error);
            }
        });
        if (!has_content) {
            logger_.info("Set env variable `DEVUI_ENV` to `dev` and start your app code to interact with it in the UI.");
        }
    }

    void DevServerSupervisor::enter(SupervisorState state) {
        SupervisorState from = state_machine_.get_state();
        if (!state_machine_.transition_to(state)) {
            logger_.debug("Rejected state transition " + state_to_string(from) +
                          " -> " + state_to_string(state));
        }
    }

    StartResult DevServerSupervisor::fail(const std::string& cause) {
        enter(SupervisorState::FAILED);
        logger_.debug(cause);
        logger_.error("Failed to start Developer UI");

        StartResult result;
        result.state = SupervisorState::FAILED;
        return result;
    }

    bool DevServerSupervisor::stop() {
        return stop_dev_server(logger_, registry_, health_checker_, http_client_);
    }

    bool stop_dev_server(Logger& logger,
                         ServerRegistry& registry,
                         HealthChecker& health_checker,
                         HttpClient& http_client) {
        std::optional<ServerRegistryRecord> record = registry.read();
        if (!record) {
            logger.info("No running Developer UI found.");
            return true;
        }

        HttpResponse response = http_client.post(record->url + kQuitPath, "{}", kReuseProbeTimeout);
        registry.remove();

        if (!response.ok()) {
            std::string cause = response.error.empty()
                                    ? "status " + std::to_string(response.status_code)
                                    : response.error;
            logger.debug("Quit request to " + record->url + " failed: " + cause);

            if (health_checker.check(record->url, kReuseProbeTimeout)) {
                logger.warn("Failed to stop Developer UI at " + record->url + ": " + cause);
                return false;
            }
        }

        logger.info("Developer UI at " + record->url + " has been stopped.");
        return true;
    }

} // namespace devui
