#pragma once

#include "common/error.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace livegate {

// Components of an http(s):// or ws(s):// URL
struct UrlComponents {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;   // Path plus query, always starts with '/'
    bool use_ssl{false};
};

std::optional<UrlComponents> parse_url(const std::string& url);

struct HttpRequestSpec {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::string content_type;
    std::chrono::seconds timeout{10};
};

struct HttpResult {
    unsigned status{0};
    std::string body;
};

/**
 * Perform one blocking HTTP/1.1 request.
 * Transport failures map to ErrorCode::HTTP_ERROR; any status code is a
 * successful result and left to the caller to judge.
 */
Result<HttpResult> http_request(const HttpRequestSpec& spec);

// application/x-www-form-urlencoded encoding of one value
std::string form_urlencode(std::string_view value);

} // namespace livegate
