#include "devui/http_client.hpp"
#include <cpr/cpr.h>

namespace devui {

    namespace {

        HttpResponse from_cpr(const cpr::Response& response) {
            HttpResponse out;
            if (response.error.code != cpr::ErrorCode::OK) {
                out.error = response.error.message.empty() ? "request failed"
                                                           : response.error.message;
                return out;
            }
            out.status_code = response.status_code;
            out.text = response.text;
            return out;
        }

    } // namespace

    HttpResponse CprHttpClient::get(const std::string& url, std::chrono::milliseconds timeout) {
        cpr::Response response = cpr::Get(cpr::Url{url},
                                          cpr::Timeout{timeout});
        return from_cpr(response);
    }

    HttpResponse CprHttpClient::post(const std::string& url,
                                     const std::string& json_body,
                                     std::chrono::milliseconds timeout) {
        cpr::Response response = cpr::Post(cpr::Url{url},
                                           cpr::Body{json_body},
                                           cpr::Header{{"Content-Type", "application/json"}},
                                           cpr::Timeout{timeout});
        return from_cpr(response);
    }

} // namespace devui
