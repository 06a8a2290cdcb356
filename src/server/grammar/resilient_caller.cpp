#include "resilient_caller.hpp"

#include <algorithm>
#include <print>
#include <thread>

bool RetryPolicy::is_retryable(long status) const {
    return std::ranges::find(retry_statuses, status) != retry_statuses.end();
}

std::chrono::milliseconds RetryPolicy::delay_for(int retry) const {
    return base_delay * (1LL << retry);
}

ResilientCaller::ResilientCaller(RetryPolicy policy, Sleeper sleeper)
    : policy_(std::move(policy)), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::expected<HttpReply, CallFailure> ResilientCaller::call(const Attempt& attempt) const {
    const int attempts = std::max(policy_.max_attempts, 1);

    for (int i = 0; i < attempts; ++i) {
        auto reply = attempt();
        if (!reply) {
            return std::unexpected(CallFailure{.status = 0, .message = reply.error(), .body = {}});
        }

        if (reply->status >= 200 && reply->status < 300) {
            return std::move(*reply);
        }

        bool last = (i + 1 == attempts);
        if (!policy_.is_retryable(reply->status) || last) {
            return std::unexpected(CallFailure{
                .status = reply->status,
                .message = "HTTP " + std::to_string(reply->status),
                .body = std::move(reply->body),
            });
        }

        auto delay = policy_.delay_for(i);
        std::println(stderr, "retry: HTTP {}, attempt {}/{} failed, retrying in {}ms",
                     reply->status, i + 1, attempts, delay.count());
        sleeper_(delay);
    }

    // not reached: the last iteration always returns
    return std::unexpected(CallFailure{.status = 0, .message = "no attempts made", .body = {}});
}
