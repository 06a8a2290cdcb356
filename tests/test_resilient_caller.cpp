#include <catch2/catch_test_macros.hpp>

#include "grammar/resilient_caller.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

// Replays a fixed list of outcomes and records the sleeps requested.
struct Script {
    std::vector<std::expected<HttpReply, std::string>> outcomes;
    size_t calls = 0;
    std::vector<std::chrono::milliseconds> sleeps;

    ResilientCaller caller(RetryPolicy policy = {}) {
        return ResilientCaller(std::move(policy),
                               [this](std::chrono::milliseconds d) { sleeps.push_back(d); });
    }

    ResilientCaller::Attempt attempt() {
        return [this]() { return outcomes.at(calls++); };
    }
};

HttpReply reply(long status, std::string body = {}) {
    return HttpReply{.status = status, .body = std::move(body)};
}

} // namespace

TEST_CASE("RetryPolicy", "[retry]") {
    RetryPolicy p;
    REQUIRE(p.is_retryable(429));
    REQUIRE(p.is_retryable(503));
    REQUIRE_FALSE(p.is_retryable(500));
    REQUIRE_FALSE(p.is_retryable(400));
    REQUIRE(p.delay_for(0) == 1000ms);
    REQUIRE(p.delay_for(1) == 2000ms);
    REQUIRE(p.delay_for(2) == 4000ms);
}

TEST_CASE("ResilientCaller", "[retry]") {
    Script s;

    SECTION("FirstSuccessReturnsImmediately") {
        s.outcomes = {reply(200, "ok")};
        auto r = s.caller().call(s.attempt());
        REQUIRE(r.has_value());
        REQUIRE(r->body == "ok");
        REQUIRE(s.calls == 1);
        REQUIRE(s.sleeps.empty());
    }

    SECTION("RecoversAfterRateLimit") {
        s.outcomes = {reply(429), reply(429), reply(200, "ok")};
        auto r = s.caller().call(s.attempt());
        REQUIRE(r.has_value());
        REQUIRE(r->body == "ok");
        REQUIRE(s.calls == 3);
        REQUIRE(s.sleeps == std::vector<std::chrono::milliseconds>{1000ms, 2000ms});
    }

    SECTION("ServiceUnavailableIsRetried") {
        s.outcomes = {reply(503), reply(201, "created")};
        auto r = s.caller().call(s.attempt());
        REQUIRE(r.has_value());
        REQUIRE(s.calls == 2);
    }

    SECTION("GivesUpAfterFourAttempts") {
        s.outcomes = {reply(429), reply(429), reply(429), reply(429, "slow down")};
        auto r = s.caller().call(s.attempt());
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().status == 429);
        REQUIRE(r.error().body == "slow down");
        REQUIRE(s.calls == 4);
        REQUIRE(s.sleeps == std::vector<std::chrono::milliseconds>{1000ms, 2000ms, 4000ms});
    }

    SECTION("OtherStatusesAreNotRetried") {
        s.outcomes = {reply(500, "internal")};
        auto r = s.caller().call(s.attempt());
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().status == 500);
        REQUIRE(r.error().message == "HTTP 500");
        REQUIRE(s.calls == 1);
        REQUIRE(s.sleeps.empty());
    }

    SECTION("TransportErrorEndsTheCall") {
        s.outcomes = {std::unexpected(std::string("Couldn't resolve host name"))};
        auto r = s.caller().call(s.attempt());
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().status == 0);
        REQUIRE(r.error().message == "Couldn't resolve host name");
        REQUIRE(s.calls == 1);
    }

    SECTION("SingleAttemptPolicy") {
        s.outcomes = {reply(429)};
        auto r = s.caller(RetryPolicy{.max_attempts = 1}).call(s.attempt());
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().status == 429);
        REQUIRE(s.calls == 1);
        REQUIRE(s.sleeps.empty());
    }

    SECTION("CustomBaseDelay") {
        s.outcomes = {reply(503), reply(503), reply(200)};
        auto r = s.caller(RetryPolicy{.base_delay = 10ms}).call(s.attempt());
        REQUIRE(r.has_value());
        REQUIRE(s.sleeps == std::vector<std::chrono::milliseconds>{10ms, 20ms});
    }
}
