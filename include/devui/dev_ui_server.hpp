/**
 * @file dev_ui_server.hpp
 * @brief Routes served by the Developer UI harness
 *
 *   GET       /api/__health           200 {"status":"OK"}
 *   GET|POST  /api/__quitquitquit     200, then the server shuts down
 *   GET       /api/trpc/listActions   actions of the most recent runtime
 *   GET       /api/runtimes           registered runtimes
 *   GET       /                       status page
 */

#pragma once

#include <string>
#include <functional>

#include "devui/http_server.hpp"

namespace devui {

    class RuntimeRegistry;
    class HttpClient;
    class Logger;

    /**
     * @brief Request handlers of the harness, independent of the socket layer
     */
    class DevUiApp {
    public:
        /**
         * @param registry Runtimes visible to the UI
         * @param http_client Used to reach runtime reflection servers
         * @param logger Harness log
         * @param on_quit Invoked after a quit request has been answered
         */
        DevUiApp(RuntimeRegistry& registry,
                 HttpClient& http_client,
                 Logger& logger,
                 std::function<void()> on_quit);

        /**
         * @brief Registers every route on server
         */
        void install(HttpServer& server);

        HttpReply handle_health(const HttpRequest& request);
        HttpReply handle_quit(const HttpRequest& request);
        HttpReply handle_list_actions(const HttpRequest& request);
        HttpReply handle_runtimes(const HttpRequest& request);
        HttpReply handle_index(const HttpRequest& request);

    private:
        RuntimeRegistry& registry_;
        HttpClient& http_client_;
        Logger& logger_;
        std::function<void()> on_quit_;
    };

} // namespace devui
