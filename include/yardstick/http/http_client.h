#pragma once

/*
 * Transport seam for the contract executor. Production code uses the libcurl
 * client from makeCurlHttpClient(); tests substitute their own IHttpClient.
 */

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <memory>
#include <string>

#include <yardstick/core/types.h>

namespace yardstick::http {

// HTTP header names compare case-insensitively.
struct HeaderNameLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
                                            [](unsigned char x, unsigned char y) {
                                                return std::tolower(x) < std::tolower(y);
                                            });
    }
};

using HeaderMap = std::map<std::string, std::string, HeaderNameLess>;

struct HttpRequest {
    std::string method{"POST"};
    std::string url;
    HeaderMap headers;
    std::string body;
    std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
    long status{0};
    std::string body;

    bool success() const noexcept { return status >= 200 && status < 300; }
};

/**
 * One blocking request/response exchange. Non-2xx responses are returned as
 * values; only transport failures produce an error (NetworkError or Timeout).
 * Implementations must be safe to call from several threads at once.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

std::unique_ptr<IHttpClient> makeCurlHttpClient();

} // namespace yardstick::http
