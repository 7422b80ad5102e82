#include "devui/dev_ui_server.hpp"
#include "devui/runtime_registry.hpp"
#include "devui/http_client.hpp"
#include "devui/logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>

namespace devui {

    namespace {

        constexpr std::chrono::milliseconds kReflectionTimeout{5000};

        HttpReply json_reply(int status, const nlohmann::json& body) {
            HttpReply reply;
            reply.status = status;
            reply.body = body.dump();
            return reply;
        }

        std::string html_escape(const std::string& text) {
            std::string out;
            for (char c : text) {
                switch (c) {
                    case '&': out += "&amp;"; break;
                    case '<': out += "&lt;"; break;
                    case '>': out += "&gt;"; break;
                    case '"': out += "&quot;"; break;
                    default:  out += c;
                }
            }
            return out;
        }

    } // namespace

    DevUiApp::DevUiApp(RuntimeRegistry& registry,
                       HttpClient& http_client,
                       Logger& logger,
                       std::function<void()> on_quit)
        : registry_(registry)
        , http_client_(http_client)
        , logger_(logger)
        , on_quit_(std::move(on_quit)) {}

    void DevUiApp::install(HttpServer& server) {
        server.route("GET", "/api/__health", [this](const HttpRequest& r) { return handle_health(r); });
        server.route("GET", "/api/__quitquitquit", [this](const HttpRequest& r) { return handle_quit(r); });
        server.route("POST", "/api/__quitquitquit", [this](const HttpRequest& r) { return handle_quit(r); });
        server.route("GET", "/api/trpc/listActions", [this](const HttpRequest& r) { return handle_list_actions(r); });
        server.route("GET", "/api/runtimes", [this](const HttpRequest& r) { return handle_runtimes(r); });
        server.route("GET", "/", [this](const HttpRequest& r) { return handle_index(r); });
    }

    HttpReply DevUiApp::handle_health(const HttpRequest&) {
        return json_reply(200, {{"status", "OK"}});
    }

    HttpReply DevUiApp::handle_quit(const HttpRequest&) {
        logger_.info("Quit requested");
        if (on_quit_) {
            // Only stops accepting; this reply is still delivered
            on_quit_();
        }
        return json_reply(200, {{"status", "stopping"}});
    }

    HttpReply DevUiApp::handle_list_actions(const HttpRequest&) {
        std::optional<RuntimeInfo> runtime = registry_.most_recent();
        if (!runtime) {
            return json_reply(500, {{"error", "No runtime registered"}});
        }

        std::string url = runtime->reflection_server_url + "/api/actions";
        HttpResponse response = http_client_.get(url, kReflectionTimeout);
        if (!response.ok()) {
            std::string cause = response.error.empty()
                                    ? "status " + std::to_string(response.status_code)
                                    : response.error;
            logger_.warn("Failed to list actions from " + url + ": " + cause);
            return json_reply(500, {{"error", "Failed to list actions: " + cause}});
        }

        nlohmann::json actions = nlohmann::json::parse(response.text, nullptr, false);
        if (actions.is_discarded()) {
            return json_reply(500, {{"error", "Runtime returned invalid JSON"}});
        }
        return json_reply(200, {{"result", {{"data", actions}}}});
    }

    HttpReply DevUiApp::handle_runtimes(const HttpRequest&) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& runtime : registry_.list()) {
            out.push_back(runtime.to_json());
        }
        return json_reply(200, out);
    }

    HttpReply DevUiApp::handle_index(const HttpRequest&) {
        std::string rows;
        for (const auto& runtime : registry_.list()) {
            rows += "<li>" + html_escape(runtime.id) + " - " +
                    html_escape(runtime.reflection_server_url) + "</li>";
        }
        if (rows.empty()) {
            rows = "<li>No runtimes registered. Set <code>DEVUI_ENV=dev</code> and start your app.</li>";
        }

        HttpReply reply;
        reply.content_type = "text/html; charset=utf-8";
        reply.body = "<!doctype html><html><head><title>Developer UI</title></head><body>"
                     "<h1>Developer UI</h1><h2>Runtimes</h2><ul>" + rows +
                     "</ul></body></html>";
        return reply;
    }

} // namespace devui
