#include "devui/health_checker.hpp"
#include "devui/http_client.hpp"
#include <algorithm>
#include <thread>

namespace devui {

    HttpHealthChecker::HttpHealthChecker(HttpClient& client, std::chrono::milliseconds poll_interval)
        : client_(client)
        , poll_interval_(poll_interval) {}

    bool HttpHealthChecker::check(const std::string& base_url, std::chrono::milliseconds timeout) {
        HttpResponse response = client_.get(base_url + kHealthPath, timeout);
        return response.transport_ok() && response.status_code == 200;
    }

    bool HttpHealthChecker::wait_until_healthy(const std::string& base_url,
                                               std::chrono::milliseconds budget,
                                               const std::function<bool()>& should_abort) {
        using namespace std::chrono;
        auto deadline = steady_clock::now() + budget;

        while (true) {
            auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
            if (remaining <= milliseconds::zero()) {
                return false;
            }

            if (check(base_url, std::min(remaining, kReuseProbeTimeout))) {
                return true;
            }

            if (should_abort && should_abort()) {
                return false;
            }

            remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
            if (remaining <= milliseconds::zero()) {
                return false;
            }
            std::this_thread::sleep_for(std::min(remaining, poll_interval_));
        }
    }

} // namespace devui
