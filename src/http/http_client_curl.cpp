/*
 * http_client_curl.cpp
 *
 * Notes
 * - One easy handle per request; the client itself holds no mutable state.
 * - Honors per-request timeout, headers and method. Redirects are not followed.
 * - Transport failures map to NetworkError or Timeout; HTTP status is returned as-is.
 */

#include <yardstick/http/http_client.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <string_view>

namespace yardstick::http {

// Map CURLcode to Error
static Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        default:
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

// CURL write callback: append body bytes to a std::string
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

// Helper to build curl_slist from headers
static curl_slist* build_header_list(const HeaderMap& headers) {
    curl_slist* list = nullptr;
    for (const auto& [name, value] : headers) {
        std::string line = name;
        line.append(": ");
        line.append(value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

// Common CURL easy handle configuration
static void configure_common(CURL* curl, std::chrono::milliseconds timeout) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(timeout.count(), 30000)));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    // Required for timeouts in multi-threaded programs
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
}

class CurlHttpClient final : public IHttpClient {
public:
    CurlHttpClient() {
        static std::once_flag curlInitFlag;
        std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_ALL); });
    }
    ~CurlHttpClient() override = default;

    Result<HttpResponse> send(const HttpRequest& request) override {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }

        auto headers = request.headers;
        if (headers.find("Content-Type") == headers.end())
            headers.emplace("Content-Type", "application/json");
        if (headers.find("Accept") == headers.end())
            headers.emplace("Accept", "application/json");
        curl_slist* list = build_header_list(headers);

        HttpResponse response;
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

        configure_common(curl, request.timeout);

        spdlog::debug("HTTP {} {} ({} bytes)", request.method, request.url, request.body.size());
        CURLcode rc = curl_easy_perform(curl);
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (rc != CURLE_OK) {
            return makeCurlError(rc, request.method + " " + request.url);
        }
        spdlog::debug("HTTP {} {} -> {}", request.method, request.url, response.status);
        return response;
    }
};

std::unique_ptr<IHttpClient> makeCurlHttpClient() {
    return std::make_unique<CurlHttpClient>();
}

} // namespace yardstick::http
