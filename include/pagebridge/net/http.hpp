#pragma once

#include "pagebridge/util/result.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pagebridge {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

// Case-insensitive lookup; returns "" when absent.
std::string FindHeader(const HttpHeaders& headers, std::string_view name);

// Replaces an existing header of the same name (case-insensitive) or appends.
void SetHeader(HttpHeaders& headers, std::string name, std::string value);

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::string body;
    HttpHeaders headers;
};

struct HttpResponse {
    int status = 0;
    HttpHeaders headers;
    std::string body;

    bool IsSuccess() const { return status >= 200 && status < 300; }
    std::string Header(std::string_view name) const { return FindHeader(headers, name); }
};

// A failed Result means no HTTP exchange completed. Any received status,
// including 4xx/5xx, is returned through `out` with an Ok result.
class IHttpTransport {
  public:
    virtual ~IHttpTransport() = default;
    virtual Result Send(const HttpRequest& req, HttpResponse& out) = 0;
};

// "<operation> failed: HTTP <status> - <body>"
Result HttpFailure(const char* operation, const HttpResponse& resp);

std::string UrlEncode(std::string_view s);

} // namespace pagebridge
