#include "devui/http_server.hpp"
#include "devui/logger.hpp"
#include "devui/utils.hpp"
#include <sockpp/inet_address.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <sstream>
#include <thread>
#include <vector>

namespace devui {

    namespace {

        /// Whole-request read limit per connection
        constexpr std::chrono::milliseconds kClientReadTimeout{5000};

        HttpReply json_error(int status, const std::string& message) {
            HttpReply reply;
            reply.status = status;
            reply.body = nlohmann::json{{"error", message}}.dump();
            return reply;
        }

    } // namespace

    HttpServer::HttpServer(std::string host, int port, Logger& logger)
        : host_(std::move(host))
        , port_(port)
        , logger_(logger)
        , acceptor_(std::make_unique<sockpp::tcp_acceptor>()) {}

    HttpServer::~HttpServer() {
        stop();
        std::lock_guard<std::mutex> lock(acceptor_mutex_);
        if (acceptor_ && acceptor_->is_open()) {
            acceptor_->close();
        }
    }

    void HttpServer::route(const std::string& method, const std::string& path, RouteHandler handler) {
        routes_[method + " " + path] = std::move(handler);
    }

    void HttpServer::start() {
        sockpp::inet_address addr(host_, static_cast<in_port_t>(port_));

        if (!acceptor_->open(addr, 16, sockpp::tcp_acceptor::REUSE)) {
            throw std::runtime_error("Failed to bind to " + host_ + ":" + std::to_string(port_));
        }

        sockpp::inet_address bound(acceptor_->address());
        port_ = bound.port();
        running_ = true;

        logger_.info("Developer UI server listening on " + host_ + ":" + std::to_string(port_));
    }

    void HttpServer::serve() {
        while (running_) {
            auto client = acceptor_->accept();

            if (!client.is_ok()) {
                if (running_) {
                    logger_.warn("Failed to accept client: " + client.error_message());
                }
                continue;
            }

            reap_finished_clients();

            // One thread per client, joined before serve() returns
            auto client_value = client.release();
            std::lock_guard<std::mutex> lock(clients_mutex_);
            uint64_t id = next_client_id_++;
            client_threads_.emplace(id, std::thread(&HttpServer::process_client, this, id,
                                                    std::move(client_value)));
        }

        {
            std::lock_guard<std::mutex> lock(acceptor_mutex_);
            acceptor_->close();
        }

        std::map<uint64_t, std::thread> remaining;
        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            remaining.swap(client_threads_);
            finished_clients_.clear();
        }
        if (!remaining.empty()) {
            logger_.debug("Waiting for " + std::to_string(remaining.size()) + " open connection(s)");
        }
        for (auto& [id, thread] : remaining) {
            thread.join();
        }
    }

    void HttpServer::reap_finished_clients() {
        std::vector<std::thread> done;
        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            for (uint64_t id : finished_clients_) {
                auto it = client_threads_.find(id);
                if (it != client_threads_.end()) {
                    done.push_back(std::move(it->second));
                    client_threads_.erase(it);
                }
            }
            finished_clients_.clear();
        }
        for (auto& thread : done) {
            thread.join();
        }
    }

    void HttpServer::stop() {
        if (!running_.exchange(false)) {
            return;
        }
        // Wakes a thread blocked in accept()
        std::lock_guard<std::mutex> lock(acceptor_mutex_);
        if (acceptor_ && acceptor_->is_open()) {
            auto result = acceptor_->shutdown();
            if (!result) {
                logger_.debug("Acceptor shutdown failed: " + result.error_message());
            }
        }
    }

    void HttpServer::process_client(uint64_t id, sockpp::tcp_socket client) {
        using namespace std::chrono;
        auto read_deadline = steady_clock::now() + kClientReadTimeout;

        std::string raw;
        char buffer[4096];
        size_t header_end = std::string::npos;
        size_t expected = 0;

        while (true) {
            // A slow sender cannot stretch the read past the deadline
            auto remaining = duration_cast<milliseconds>(read_deadline - steady_clock::now());
            if (remaining <= milliseconds::zero()) {
                break;
            }
            if (!client.read_timeout(remaining)) {
                logger_.debug("Could not set read timeout on client socket");
            }

            auto read_result = client.recv(buffer, sizeof(buffer));
            if (!read_result.is_ok() || read_result.value() == 0) {
                break;
            }
            raw.append(buffer, read_result.value());

            if (header_end == std::string::npos) {
                header_end = raw.find("\r\n\r\n");
                if (header_end != std::string::npos) {
                    expected = header_end + 4;
                    auto parsed = parse_request(raw.substr(0, header_end + 4));
                    if (parsed) {
                        auto it = parsed->headers.find("content-length");
                        if (it != parsed->headers.end()) {
                            try {
                                expected += static_cast<size_t>(std::stoul(it->second));
                            } catch (const std::exception&) {
                                expected = kMaxRequestSize + 1;
                            }
                        }
                    }
                }
            }

            if ((header_end != std::string::npos && raw.size() >= expected) ||
                raw.size() > kMaxRequestSize) {
                break;
            }
        }

        HttpReply reply;
        if (raw.size() > kMaxRequestSize) {
            reply = json_error(413, "Request too large");
        } else if (header_end == std::string::npos || raw.size() < expected) {
            reply = json_error(400, "Incomplete request");
        } else if (auto request = parse_request(raw.substr(0, expected))) {
            reply = dispatch(*request);
        } else {
            reply = json_error(400, "Malformed request line");
        }

        auto write_result = client.write(format_reply(reply));
        if (!write_result.is_ok()) {
            logger_.debug("Failed to send response: " + write_result.error_message());
        }

        client.close();

        std::lock_guard<std::mutex> lock(clients_mutex_);
        finished_clients_.push_back(id);
    }

    HttpReply HttpServer::dispatch(const HttpRequest& request) {
        auto it = routes_.find(request.method + " " + request.path);
        if (it == routes_.end()) {
            return json_error(404, "Not found: " + request.method + " " + request.path);
        }

        try {
            return it->second(request);
        } catch (const std::exception& e) {
            logger_.error("Handler for " + request.path + " failed: " + e.what());
            return json_error(500, e.what());
        }
    }

    std::optional<HttpRequest> HttpServer::parse_request(const std::string& raw) {
        size_t line_end = raw.find("\r\n");
        if (line_end == std::string::npos) {
            return std::nullopt;
        }

        std::istringstream line(raw.substr(0, line_end));
        HttpRequest request;
        std::string target;
        std::string version;
        if (!(line >> request.method >> target >> version) ||
            version.rfind("HTTP/", 0) != 0 || target.empty() || target[0] != '/') {
            return std::nullopt;
        }

        size_t query_pos = target.find('?');
        if (query_pos != std::string::npos) {
            request.path = target.substr(0, query_pos);
            request.query = target.substr(query_pos + 1);
        } else {
            request.path = target;
        }

        size_t headers_end = raw.find("\r\n\r\n");
        size_t pos = line_end + 2;
        size_t stop = headers_end == std::string::npos ? raw.size() : headers_end;
        while (pos < stop) {
            size_t next = raw.find("\r\n", pos);
            if (next == std::string::npos || next > stop) {
                next = stop;
            }
            std::string header = raw.substr(pos, next - pos);
            size_t colon = header.find(':');
            if (colon != std::string::npos) {
                request.headers[to_lower(trim(header.substr(0, colon)))] = trim(header.substr(colon + 1));
            }
            pos = next + 2;
        }

        if (headers_end != std::string::npos) {
            request.body = raw.substr(headers_end + 4);
        }
        return request;
    }

    std::string HttpServer::reason_phrase(int status) {
        switch (status) {
            case 200: return "OK";
            case 204: return "No Content";
            case 400: return "Bad Request";
            case 404: return "Not Found";
            case 405: return "Method Not Allowed";
            case 413: return "Payload Too Large";
            case 500: return "Internal Server Error";
            case 502: return "Bad Gateway";
            case 503: return "Service Unavailable";
            default:  return "Unknown";
        }
    }

    std::string HttpServer::format_reply(const HttpReply& reply) {
        std::ostringstream out;
        out << "HTTP/1.1 " << reply.status << " " << reason_phrase(reply.status) << "\r\n"
            << "Content-Type: " << reply.content_type << "\r\n"
            << "Content-Length: " << reply.body.size() << "\r\n"
            << "Connection: close\r\n"
            << "\r\n"
            << reply.body;
        return out.str();
    }

} // namespace devui
