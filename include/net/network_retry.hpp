#pragma once

#include "net/http_transport.hpp"
#include "core/engine_config.hpp"
#include "core/errors.hpp"
#include "core/clock.hpp"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <thread>
#include <chrono>
#include <cmath>
#include <optional>
#include <functional>
#include <type_traits>
#include <algorithm>
#include <iostream>
#include <nlohmann/json.hpp>

namespace gv {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Options for a single logical request
 */
struct RequestOptions {
    std::string method = "GET";
    std::vector<std::string> headers;
    std::string body;
};

/**
 * @brief How many times to try and how long to wait in between
 *
 * Attempt n (1-based) that fails waits delay_ms * backoff^(n-1) before
 * attempt n+1.
 */
struct RetryPolicy {
    int attempts = 3;
    int delay_ms = 1000;
    double backoff = 2.0;

    // Classifier; when empty every NetworkError is retried
    std::function<bool(const std::exception&)> should_retry;

    int64_t delay_after(int attempt) const {
        return static_cast<int64_t>(delay_ms * std::pow(backoff, attempt - 1));
    }

    static RetryPolicy from_config(const EdgeCaseConfig& config);
};

/**
 * @brief Last failure seen for a URL (or other retry key)
 */
struct NetworkFailureContext {
    std::string url;
    std::string method;
    int attempts = 0;                       ///< Attempts made so far
    std::string last_error;
    Clock::TimePoint timestamp;
    std::optional<int64_t> retry_after_ms;  ///< Set when another attempt follows

    nlohmann::json to_json() const;
};

using NetworkFailureHandler = std::function<void(const NetworkFailureContext&)>;

// ============================================================================
// NetworkRetry
// ============================================================================

/**
 * @brief Retry-with-backoff wrapper around an HttpTransport
 *
 * Keeps one failure record per key, cleared as soon as a call for that key
 * succeeds. Safe to use from several threads.
 */
class NetworkRetry {
public:
    NetworkRetry(
        HttpTransport& transport,
        const EdgeCaseConfig& config = EdgeCaseConfig{},
        const Clock& clock = SteadyClock::instance()
    );

    /**
     * @brief Fetch url and parse the body as JSON, retrying on failure
     *
     * Each attempt is bounded by the configured network timeout.
     *
     * @param url Absolute URL
     * @param options Method, headers and body
     * @param policy Retry policy; defaults to the configured one
     * @return Parsed response body
     * @throws The last attempt's error once attempts are exhausted
     */
    nlohmann::json request(
        const std::string& url,
        const RequestOptions& options = RequestOptions{},
        const std::optional<RetryPolicy>& policy = std::nullopt
    );

    /**
     * @brief Run fn until it succeeds or the policy gives up
     *
     * @param key Failure-record key (normally the URL)
     * @param method Recorded in failure contexts
     * @param fn Callable returning a non-void value; throws on failure
     * @param policy Retry policy
     */
    template<typename Func>
    auto execute(
        const std::string& key,
        const std::string& method,
        Func&& fn,
        const RetryPolicy& policy
    ) -> decltype(fn());

    RetryPolicy default_policy() const { return RetryPolicy::from_config(config_); }

    // ==========================================
    // Failure records
    // ==========================================

    std::optional<NetworkFailureContext> failure(const std::string& key) const;
    size_t failure_count() const;

    /**
     * @brief Drop failure records older than max_age
     * @return Number of records removed
     */
    size_t prune_failures(std::chrono::milliseconds max_age);

    void clear();

    void set_failure_handler(NetworkFailureHandler handler);

    /**
     * @brief Default classifier used when a policy has none
     */
    static bool is_retryable(const std::exception& error);

private:
    HttpTransport& transport_;
    EdgeCaseConfig config_;
    const Clock& clock_;

    mutable std::mutex mutex_;
    std::map<std::string, NetworkFailureContext> failures_;
    NetworkFailureHandler failure_handler_;

    void record_failure(
        const std::string& key,
        const std::string& method,
        int attempt,
        const std::string& error,
        std::optional<int64_t> retry_after_ms
    );

    void clear_failure(const std::string& key);
};

// ============================================================================
// Template implementation
// ============================================================================

template<typename Func>
auto NetworkRetry::execute(
    const std::string& key,
    const std::string& method,
    Func&& fn,
    const RetryPolicy& policy
) -> decltype(fn()) {
    static_assert(!std::is_void<decltype(fn())>::value,
                  "NetworkRetry::execute needs a callable that returns a value");

    const int max_attempts = std::max(1, policy.attempts);

    for (int attempt = 1; ; ++attempt) {
        try {
            auto result = fn();
            clear_failure(key);
            return result;
        } catch (const std::exception& e) {
            const bool retryable = policy.should_retry ? policy.should_retry(e) : is_retryable(e);
            const bool another = retryable && attempt < max_attempts;

            std::optional<int64_t> retry_after;
            if (another) {
                retry_after = policy.delay_after(attempt);
            }

            record_failure(key, method, attempt, e.what(), retry_after);

            if (!another) {
                throw;
            }

            if (config_.verbose) {
                std::cerr << "Attempt " << attempt << " failed for " << key
                          << ": " << e.what() << ". Retrying in "
                          << *retry_after << "ms..." << std::endl;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(*retry_after));
        }
    }
}

} // namespace gv
