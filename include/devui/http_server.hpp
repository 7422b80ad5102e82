/**
 * @file http_server.hpp
 * @brief Minimal HTTP/1.1 server over sockpp
 *
 * This header provides a server that:
 * - Listens on host:port (port 0 lets the OS choose)
 * - Accepts client connections, one thread each, all joined on shutdown
 * - Parses one request per connection (request line, headers,
 *   Content-Length body)
 * - Dispatches on (method, path) to registered handlers
 * - Replies with Connection: close
 *
 * Enough for the Developer UI harness; not a general purpose server.
 */

#pragma once

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <optional>
#include <functional>
#include <cstdint>
#include <thread>
#include <vector>
#include <sockpp/tcp_acceptor.h>
#include <sockpp/tcp_socket.h>

namespace devui {

    class Logger;

    /// Largest request accepted (headers + body)
    constexpr size_t kMaxRequestSize = 1024 * 1024;

    struct HttpRequest {
        std::string method;                             ///< "GET", "POST", ...
        std::string path;                               ///< Path without query string
        std::string query;                              ///< Text after '?', if any
        std::map<std::string, std::string> headers;     ///< Lower-cased names
        std::string body;
    };

    struct HttpReply {
        int status = 200;
        std::string content_type = "application/json";
        std::string body;
    };

    using RouteHandler = std::function<HttpReply(const HttpRequest&)>;

    /**
     * @brief Request/response server for local tooling endpoints
     *
     * Usage:
     *   HttpServer server("127.0.0.1", 4000, logger);
     *   server.route("GET", "/api/__health", [](const HttpRequest&) { ... });
     *   server.start();   // bind
     *   server.serve();   // blocks until stop()
     */
    class HttpServer {
    public:
        HttpServer(std::string host, int port, Logger& logger);

        /**
         * @brief Destructor
         *
         * Stops accepting and closes the acceptor socket.
         */
        ~HttpServer();

        HttpServer(const HttpServer&) = delete;
        HttpServer& operator=(const HttpServer&) = delete;

        /**
         * @brief Registers a handler for an exact method and path
         *
         * Must be called before serve().
         */
        void route(const std::string& method, const std::string& path, RouteHandler handler);

        /**
         * @brief Binds the listening socket
         *
         * @throws std::runtime_error if binding fails
         */
        void start();

        /**
         * @brief Accept loop; returns after stop()
         *
         * Joins every client thread before returning, so handlers never
         * outlive the server. Request reads are bounded by a deadline.
         */
        void serve();

        /**
         * @brief Makes serve() return
         *
         * Safe to call from any thread, including a handler thread.
         */
        void stop();

        /**
         * @brief Gets the bound port
         *
         * @return int Actual port after start(), requested port before
         */
        [[nodiscard]] int get_port() const { return port_; }

        [[nodiscard]] bool is_running() const { return running_.load(); }

        /**
         * @brief Parses a complete raw request
         *
         * @return std::optional<HttpRequest> Empty for a malformed request line
         */
        static std::optional<HttpRequest> parse_request(const std::string& raw);

        /**
         * @brief Serializes a reply including status line and headers
         */
        static std::string format_reply(const HttpReply& reply);

        static std::string reason_phrase(int status);

    private:
        std::string host_;
        int port_;
        Logger& logger_;
        std::unique_ptr<sockpp::tcp_acceptor> acceptor_;
        std::mutex acceptor_mutex_;
        std::map<std::string, RouteHandler> routes_;   ///< Keyed by "METHOD path"
        std::atomic<bool> running_{false};

        std::mutex clients_mutex_;
        std::map<uint64_t, std::thread> client_threads_;
        std::vector<uint64_t> finished_clients_;      ///< Ids whose threads are ready to join
        uint64_t next_client_id_ = 1;

        void process_client(uint64_t id, sockpp::tcp_socket client);
        void reap_finished_clients();
        HttpReply dispatch(const HttpRequest& request);
    };

} // namespace devui
