/**
 * @file http_client.hpp
 * @brief Minimal blocking HTTP client interface and its libcpr implementation
 *
 * Every outbound request devui makes (health probes, the post-start
 * content probe, the stop request, the reflection proxy) goes through
 * HttpClient so that tests can substitute a scripted fake.
 */

#pragma once

#include <string>
#include <chrono>

namespace devui {

    /**
     * @brief Outcome of a single request
     *
     * status_code is 0 when no HTTP response was received; error then
     * carries the transport failure (connection refused, timeout, ...).
     */
    struct HttpResponse {
        long status_code = 0;
        std::string text;
        std::string error;

        [[nodiscard]] bool transport_ok() const { return error.empty() && status_code != 0; }
        [[nodiscard]] bool ok() const { return transport_ok() && status_code >= 200 && status_code < 300; }
    };

    /**
     * @brief Blocking HTTP client
     *
     * Implementations must not throw for network failures; those are
     * reported through HttpResponse::error.
     */
    class HttpClient {
    public:
        virtual ~HttpClient() = default;

        virtual HttpResponse get(const std::string& url, std::chrono::milliseconds timeout) = 0;

        virtual HttpResponse post(const std::string& url,
                                  const std::string& json_body,
                                  std::chrono::milliseconds timeout) = 0;
    };

    /**
     * @brief HttpClient backed by libcpr (libcurl wrapper)
     */
    class CprHttpClient : public HttpClient {
    public:
        HttpResponse get(const std::string& url, std::chrono::milliseconds timeout) override;

        HttpResponse post(const std::string& url,
                          const std::string& json_body,
                          std::chrono::milliseconds timeout) override;
    };

} // namespace devui
