#include "devui/server_harness.hpp"
#include "devui/logger.hpp"
#include "devui/http_client.hpp"
#include "devui/http_server.hpp"
#include "devui/health_checker.hpp"
#include "devui/runtime_registry.hpp"
#include "devui/dev_ui_server.hpp"
#include "devui/utils.hpp"
#include <csignal>
#include <pthread.h>
#include <unistd.h>
#include <sstream>
#include <thread>

namespace devui {

    namespace {

        const char* kRule = "================================================================================\n";

        /// Signals waited for by the shutdown thread; SIGUSR1 only wakes it
        sigset_t shutdown_signals() {
            sigset_t set;
            sigemptyset(&set);
            sigaddset(&set, SIGINT);
            sigaddset(&set, SIGTERM);
            sigaddset(&set, SIGUSR1);
            return set;
        }

    } // namespace

    void write_session_header(Logger& log, int port) {
        std::ostringstream out;
        out << kRule
            << "Developer UI Server Log\n"
            << kRule
            << "Start Time: " << local_timestamp() << "\n"
            << "PID: " << getpid() << "\n"
            << "Port: " << port << "\n"
            << "Version: " << DEVUI_VERSION << "\n"
            << kRule;
        log.write_raw(out.str());
    }

    void write_session_footer(Logger& log, const std::string& shutdown_reason) {
        std::ostringstream out;
        out << "\n" << kRule
            << "Developer UI Server Teardown\n"
            << kRule
            << "Stop Time: " << local_timestamp() << "\n"
            << "Shutdown Method: " << shutdown_reason << "\n"
            << kRule
            << "End of log\n"
            << kRule;
        log.write_raw(out.str());
    }

    int run_server_harness(const HarnessOptions& options) {
        // Ignore SIGPIPE to prevent crashes when clients disconnect
        signal(SIGPIPE, SIG_IGN);

        // Every thread created below inherits the blocked set
        sigset_t signals = shutdown_signals();
        pthread_sigmask(SIG_BLOCK, &signals, nullptr);

        Logger log(options.log_path);
        log.set_console_enabled(false);

        CprHttpClient http_client;
        HttpHealthChecker health_checker(http_client);
        FileRuntimeRegistry registry(options.runtimes_dir, health_checker, log);

        HttpServer server("127.0.0.1", options.port, log);
        std::string shutdown_reason = "Quit request";

        DevUiApp app(registry, http_client, log, [&server] { server.stop(); });
        app.install(server);

        try {
            server.start();
        } catch (const std::exception& e) {
            write_session_header(log, options.port);
            log.error(e.what());
            write_session_footer(log, "Bind failure");
            return 1;
        }

        write_session_header(log, server.get_port());
        registry.start();

        std::thread signal_thread([&server, &log, &shutdown_reason, signals] {
            int sig = 0;
            if (sigwait(&signals, &sig) != 0 || sig == SIGUSR1) {
                return;
            }
            shutdown_reason = sig == SIGINT ? "SIGINT" : "SIGTERM";
            log.info("Received " + shutdown_reason + ", shutting down");
            server.stop();
        });

        server.serve();

        // Release the signal thread if it is still waiting
        if (kill(getpid(), SIGUSR1) != 0) {
            log.debug("Failed to wake signal thread");
        }
        signal_thread.join();

        registry.stop();
        write_session_footer(log, shutdown_reason);
        return 0;
    }

} // namespace devui
