#pragma once

#include "http_transport.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <string>
#include <vector>

struct RetryPolicy {
    int max_attempts = 4;
    std::vector<long> retry_statuses = {429, 503};
    // Delay before retry i (0-based) is base_delay * 2^i: 1s, 2s, 4s.
    std::chrono::milliseconds base_delay{1000};

    bool is_retryable(long status) const;
    std::chrono::milliseconds delay_for(int retry) const;
};

struct CallFailure {
    long status = 0;       // 0 when no HTTP reply was received
    std::string message;
    std::string body;      // last reply body, for diagnostics
};

// Repeats an HTTP attempt while the server answers with a transient status.
class ResilientCaller {
public:
    using Attempt = std::function<std::expected<HttpReply, std::string>()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit ResilientCaller(RetryPolicy policy = {}, Sleeper sleeper = {});

    // Returns the first 2xx reply. A transport error ends the call at once;
    // a non-retryable status, or a retryable one on the last attempt, is
    // returned as a failure carrying that status.
    std::expected<HttpReply, CallFailure> call(const Attempt& attempt) const;

    const RetryPolicy& policy() const { return policy_; }

private:
    RetryPolicy policy_;
    Sleeper sleeper_;
};
