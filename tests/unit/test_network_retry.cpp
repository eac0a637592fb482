#include <gtest/gtest.h>
#include "net/network_retry.hpp"
#include "test_doubles.hpp"
#include <chrono>
#include <vector>

using namespace gv;
using gv::test_support::ScriptedTransport;
using json = nlohmann::json;

class NetworkRetryTest : public ::testing::Test {
protected:
    ScriptedTransport transport;
    EdgeCaseConfig config;
    ManualClock clock;

    void SetUp() override {
        config.max_retry_attempts = 3;
        config.retry_delay_ms = 50;
        config.retry_backoff = 2.0;
        config.network_timeout_ms = 250;
    }
};

// ==========================================
// Policy Tests
// ==========================================

TEST(RetryPolicyTest, DelayGrowsGeometrically) {
    RetryPolicy policy;
    policy.delay_ms = 100;
    policy.backoff = 2.0;

    EXPECT_EQ(policy.delay_after(1), 100);
    EXPECT_EQ(policy.delay_after(2), 200);
    EXPECT_EQ(policy.delay_after(3), 400);
}

TEST(RetryPolicyTest, DefaultClassifierRetriesNetworkErrorsOnly) {
    EXPECT_TRUE(NetworkRetry::is_retryable(TransportError("reset")));
    EXPECT_TRUE(NetworkRetry::is_retryable(HttpStatusError(503, "busy")));
    EXPECT_TRUE(NetworkRetry::is_retryable(TimeoutError("slow")));
    EXPECT_FALSE(NetworkRetry::is_retryable(CancelledError("gone")));
    EXPECT_FALSE(NetworkRetry::is_retryable(std::runtime_error("bad payload")));
}

// ==========================================
// Request Tests
// ==========================================

TEST_F(NetworkRetryTest, SucceedsAfterTransientFailures) {
    transport.push_transport_error();
    transport.push_transport_error();
    transport.push_response(200, R"({"ok": true})");

    NetworkRetry retry(transport, config, clock);

    auto start = std::chrono::steady_clock::now();
    json body = retry.request("http://graph.test/a");
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(body["ok"].get<bool>());
    EXPECT_EQ(transport.calls(), 3);

    // 50ms after the first failure, 100ms after the second
    EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 150);

    // Success clears the record
    EXPECT_FALSE(retry.failure("http://graph.test/a").has_value());
    EXPECT_EQ(retry.failure_count(), 0);
}

TEST_F(NetworkRetryTest, PassesTimeoutAndRequestFields) {
    transport.push_response(200, "{}");

    NetworkRetry retry(transport, config, clock);

    RequestOptions options;
    options.method = "POST";
    options.headers = {"Content-Type: application/json"};
    options.body = R"({"q": 1})";
    retry.request("http://graph.test/query", options);

    std::vector<HttpRequest> requests = transport.requests();
    ASSERT_EQ(requests.size(), 1);
    const HttpRequest& sent = requests[0];
    EXPECT_EQ(sent.method, "POST");
    EXPECT_EQ(sent.url, "http://graph.test/query");
    EXPECT_EQ(sent.body, R"({"q": 1})");
    EXPECT_EQ(transport.last_timeout(), std::chrono::milliseconds(250));
}

TEST_F(NetworkRetryTest, ExhaustedAttemptsRethrowLastError) {
    config.retry_delay_ms = 1;
    transport.push_response(503, "service unavailable");

    NetworkRetry retry(transport, config, clock);

    try {
        retry.request("http://graph.test/down");
        FAIL() << "Expected HttpStatusError";
    } catch (const HttpStatusError& e) {
        EXPECT_EQ(e.status(), 503);
    }

    EXPECT_EQ(transport.calls(), 3);

    auto failure = retry.failure("http://graph.test/down");
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->attempts, 3);
    EXPECT_EQ(failure->method, "GET");
    EXPECT_FALSE(failure->retry_after_ms.has_value());
    EXPECT_NE(failure->last_error.find("503"), std::string::npos);
}

TEST_F(NetworkRetryTest, HandlerSeesEveryFailedAttempt) {
    config.retry_delay_ms = 1;
    transport.push_transport_error("refused");

    NetworkRetry retry(transport, config, clock);

    std::vector<NetworkFailureContext> seen;
    retry.set_failure_handler([&](const NetworkFailureContext& ctx) { seen.push_back(ctx); });

    EXPECT_THROW(retry.request("http://graph.test/x"), TransportError);

    ASSERT_EQ(seen.size(), 3);
    EXPECT_EQ(seen[0].attempts, 1);
    ASSERT_TRUE(seen[0].retry_after_ms.has_value());
    EXPECT_EQ(*seen[0].retry_after_ms, 1);
    EXPECT_EQ(*seen[1].retry_after_ms, 2);
    EXPECT_FALSE(seen[2].retry_after_ms.has_value());
    EXPECT_EQ(seen[2].last_error, "refused");
}

TEST_F(NetworkRetryTest, ParseErrorsAreNotRetried) {
    transport.push_response(200, "not json");

    NetworkRetry retry(transport, config, clock);

    EXPECT_THROW(retry.request("http://graph.test/bad"), json::parse_error);
    EXPECT_EQ(transport.calls(), 1);
}

// ==========================================
// Execute Tests
// ==========================================

TEST_F(NetworkRetryTest, CustomClassifierStopsEarly) {
    NetworkRetry retry(transport, config, clock);

    RetryPolicy policy = retry.default_policy();
    policy.delay_ms = 1;
    policy.should_retry = [](const std::exception& e) {
        auto* status = dynamic_cast<const HttpStatusError*>(&e);
        return !status || status->status() >= 500;
    };

    int calls = 0;
    auto fn = [&]() -> int {
        ++calls;
        throw HttpStatusError(404, "missing");
    };

    EXPECT_THROW(retry.execute("key", "GET", fn, policy), HttpStatusError);
    EXPECT_EQ(calls, 1);
}

TEST_F(NetworkRetryTest, CancellationIsNotRetried) {
    NetworkRetry retry(transport, config, clock);

    int calls = 0;
    auto fn = [&]() -> int {
        ++calls;
        throw CancelledError("viewport moved");
    };

    EXPECT_THROW(retry.execute("key", "GET", fn, retry.default_policy()), CancelledError);
    EXPECT_EQ(calls, 1);
}

TEST_F(NetworkRetryTest, SingleAttemptPolicy) {
    NetworkRetry retry(transport, config, clock);

    RetryPolicy policy;
    policy.attempts = 1;

    int calls = 0;
    auto fn = [&]() -> int {
        ++calls;
        throw TransportError("down");
    };

    EXPECT_THROW(retry.execute("key", "GET", fn, policy), TransportError);
    EXPECT_EQ(calls, 1);
}

// ==========================================
// Failure Record Tests
// ==========================================

TEST_F(NetworkRetryTest, PruneDropsOldRecords) {
    config.max_retry_attempts = 1;
    transport.push_transport_error();

    NetworkRetry retry(transport, config, clock);

    EXPECT_THROW(retry.request("http://graph.test/old"), TransportError);
    clock.advance(std::chrono::minutes(10));
    EXPECT_THROW(retry.request("http://graph.test/new"), TransportError);
    EXPECT_EQ(retry.failure_count(), 2);

    EXPECT_EQ(retry.prune_failures(std::chrono::minutes(5)), 1);
    EXPECT_FALSE(retry.failure("http://graph.test/old").has_value());
    EXPECT_TRUE(retry.failure("http://graph.test/new").has_value());

    retry.clear();
    EXPECT_EQ(retry.failure_count(), 0);
}

TEST_F(NetworkRetryTest, FailureContextToJson) {
    config.max_retry_attempts = 1;
    transport.push_transport_error("refused");

    NetworkRetry retry(transport, config, clock);
    EXPECT_THROW(retry.request("http://graph.test/j"), TransportError);

    json j = retry.failure("http://graph.test/j")->to_json();
    EXPECT_EQ(j["url"], "http://graph.test/j");
    EXPECT_EQ(j["attempts"], 1);
    EXPECT_EQ(j["last_error"], "refused");
    EXPECT_FALSE(j.contains("retry_after_ms"));
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
