#pragma once

#include <chrono>
#include <expected>
#include <string>

struct HttpReply {
    long status = 0;
    std::string body;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // One POST with a JSON body. Any HTTP status is a reply; only
    // transport-level failures (DNS, connect, timeout, TLS) are errors.
    virtual std::expected<HttpReply, std::string>
        post_json(const std::string& url, const std::string& body,
                  std::chrono::seconds timeout) = 0;
};
