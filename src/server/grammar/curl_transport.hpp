#pragma once

#include "http_transport.hpp"

class CurlTransport : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    std::expected<HttpReply, std::string>
        post_json(const std::string& url, const std::string& body,
                  std::chrono::seconds timeout) override;
};
