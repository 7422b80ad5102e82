/**
 * @file dev_server_supervisor.hpp
 * @brief The `ui:start` / `ui:stop` protocol
 *
 * start():
 * 1. CHECKING_EXISTING - read tools.json; probe the recorded URL once
 * 2. HEALTHY_REUSE     - recorded server answered; report it, spawn nothing
 * 3. STARTING          - identify runtime, build the spawn config, validate
 *                        the executable, spawn, wait for /api/__health
 * 4. STARTED           - persist tools.json, open the browser, probe content
 * 5. FAILED            - one user-facing line; causes go to DEBUG
 *
 * Only a server that passed its health check is ever written to the
 * registry. A child that fails the check is terminated.
 */

#pragma once

#include <string>
#include <optional>
#include <functional>
#include <filesystem>

#include "devui/logger.hpp"
#include "devui/state_machine.hpp"
#include "devui/runtime_identity.hpp"
#include "devui/project_config.hpp"

namespace devui {

    class ServerRegistry;
    class HealthChecker;
    class HttpClient;
    class ProcessLauncher;
    class PortAllocator;
    class BrowserOpener;

    /// Probed once after start to decide whether to print the dev-mode hint
    constexpr const char* kContentProbePath = "/api/trpc/listActions";

    /// Asks a harness to shut down
    constexpr const char* kQuitPath = "/api/__quitquitquit";

    /**
     * @brief Options of one `ui:start`
     */
    struct StartOptions {
        std::optional<int> port;    ///< Explicit port; 0 = OS-assigned; empty = default range
        bool open = false;          ///< Open the system browser after start
    };

    /**
     * @brief What start() ended with
     */
    struct StartResult {
        SupervisorState state = SupervisorState::FAILED;   ///< HEALTHY_REUSE, STARTED or FAILED
        std::string url;                                   ///< Server URL (empty on failure)

        [[nodiscard]] bool ok() const { return state != SupervisorState::FAILED; }
    };

    /**
     * @brief The `ui:stop` protocol
     *
     * Sends POST <url>/api/__quitquitquit to the recorded server and
     * removes the record whatever the outcome.
     *
     * @return true if nothing was running or the server went away
     * @return false if the server is still healthy after the request
     */
    bool stop_dev_server(Logger& logger,
                         ServerRegistry& registry,
                         HealthChecker& health_checker,
                         HttpClient& http_client);

    /**
     * @brief Orchestrates reuse-or-start of the Developer UI server
     *
     * Every collaborator is injected so tests can substitute fakes.
     *
     * Usage:
     *   DevServerSupervisor supervisor(logger, registry, health, http,
     *                                  launcher, ports, browser,
     *                                  [&] { return identify_runtime(snapshot); },
     *                                  project.get_server_log_path());
     *   auto result = supervisor.start({std::nullopt, false});
     *   return result.ok() ? 0 : 1;
     */
    class DevServerSupervisor {
    public:
        using IdentityProvider = std::function<RuntimeIdentity()>;
        using ExecutableValidator = std::function<bool(const std::string&)>;

        DevServerSupervisor(Logger& logger,
                            ServerRegistry& registry,
                            HealthChecker& health_checker,
                            HttpClient& http_client,
                            ProcessLauncher& launcher,
                            PortAllocator& port_allocator,
                            BrowserOpener& browser,
                            IdentityProvider identity_provider,
                            std::filesystem::path server_log_path,
                            ExecutableValidator validator = nullptr,
                            std::chrono::milliseconds health_timeout = kHealthCheckTimeout);

        /**
         * @brief Runs the start protocol
         *
         * Each call starts over from CHECKING_EXISTING.
         *
         * @param options Port and browser options
         * @return StartResult Terminal state and URL
         * @throws SpawnConfigError or RuntimeDetectionError on configuration
         *         errors; these are not normalized into FAILED output
         */
        StartResult start(const StartOptions& options);

        /**
         * @brief Stops the recorded server (see stop_dev_server)
         */
        bool stop();

        /**
         * @brief State reached by the last start()
         */
        [[nodiscard]] SupervisorState get_state() const { return state_machine_.get_state(); }

    private:
        Logger& logger_;
        ServerRegistry& registry_;
        HealthChecker& health_checker_;
        HttpClient& http_client_;
        ProcessLauncher& launcher_;
        PortAllocator& port_allocator_;
        BrowserOpener& browser_;
        IdentityProvider identity_provider_;
        std::filesystem::path server_log_path_;
        ExecutableValidator validator_;
        std::chrono::milliseconds health_timeout_;
        StateMachine state_machine_;

        bool try_reuse(StartResult& result);
        StartResult launch_new(const StartOptions& options);
        void after_start(const std::string& url, bool open_browser);
        StartResult fail(const std::string& cause);
        void enter(SupervisorState state);
    };

} // namespace devui
