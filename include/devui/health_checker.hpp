/**
 * @file health_checker.hpp
 * @brief Polls a server's health endpoint until it is ready or time runs out
 *
 * A server is healthy when GET <base_url>/api/__health answers 200.
 * Connection errors, timeouts and any other status all mean "not yet".
 */

#pragma once

#include <string>
#include <chrono>
#include <functional>

#include "devui/project_config.hpp"

namespace devui {

    class HttpClient;

    /// Path probed on every server devui talks to
    constexpr const char* kHealthPath = "/api/__health";

    /**
     * @brief Health probing interface
     */
    class HealthChecker {
    public:
        virtual ~HealthChecker() = default;

        /**
         * @brief One probe
         *
         * @param base_url e.g. "http://localhost:4000"
         * @param timeout Per-request timeout
         * @return true only for an HTTP 200
         */
        virtual bool check(const std::string& base_url, std::chrono::milliseconds timeout) = 0;

        /**
         * @brief Probes repeatedly until healthy, aborted or out of budget
         *
         * @param base_url Server to probe
         * @param budget Hard wall-clock limit for the whole wait
         * @param should_abort Checked between probes; returning true ends
         *        the wait early (e.g. the child process already exited).
         *        May be empty.
         * @return true if a probe succeeded within the budget
         */
        virtual bool wait_until_healthy(const std::string& base_url,
                                        std::chrono::milliseconds budget,
                                        const std::function<bool()>& should_abort) = 0;
    };

    /**
     * @brief HealthChecker issuing real HTTP requests through an HttpClient
     */
    class HttpHealthChecker : public HealthChecker {
    public:
        explicit HttpHealthChecker(HttpClient& client,
                                   std::chrono::milliseconds poll_interval = kHealthPollInterval);

        bool check(const std::string& base_url, std::chrono::milliseconds timeout) override;

        bool wait_until_healthy(const std::string& base_url,
                                std::chrono::milliseconds budget,
                                const std::function<bool()>& should_abort) override;

    private:
        HttpClient& client_;
        std::chrono::milliseconds poll_interval_;
    };

} // namespace devui
