#include "net/network_retry.hpp"
#include <iostream>

using json = nlohmann::json;

namespace gv {

// ============================================================================
// RetryPolicy / NetworkFailureContext
// ============================================================================

RetryPolicy RetryPolicy::from_config(const EdgeCaseConfig& config) {
    RetryPolicy policy;
    policy.attempts = config.max_retry_attempts;
    policy.delay_ms = config.retry_delay_ms;
    policy.backoff = config.retry_backoff;
    return policy;
}

json NetworkFailureContext::to_json() const {
    json j;
    j["url"] = url;
    j["method"] = method;
    j["attempts"] = attempts;
    j["last_error"] = last_error;
    j["timestamp_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()
    ).count();
    if (retry_after_ms) {
        j["retry_after_ms"] = *retry_after_ms;
    }
    return j;
}

// ============================================================================
// NetworkRetry
// ============================================================================

NetworkRetry::NetworkRetry(
    HttpTransport& transport,
    const EdgeCaseConfig& config,
    const Clock& clock
) : transport_(transport), config_(config), clock_(clock) {}

bool NetworkRetry::is_retryable(const std::exception& error) {
    return dynamic_cast<const NetworkError*>(&error) != nullptr;
}

json NetworkRetry::request(
    const std::string& url,
    const RequestOptions& options,
    const std::optional<RetryPolicy>& policy
) {
    HttpRequest http_request;
    http_request.method = options.method;
    http_request.url = url;
    http_request.headers = options.headers;
    http_request.body = options.body;

    const auto timeout = std::chrono::milliseconds(config_.network_timeout_ms);

    auto call = [&]() -> json {
        HttpResponse response = transport_.perform(http_request, timeout);

        if (!response.ok()) {
            // Keep error text short; bodies of error pages can be large
            throw HttpStatusError(response.status, response.body.substr(0, 200));
        }

        return json::parse(response.body);
    };

    return execute(url, options.method, call, policy ? *policy : default_policy());
}

// ==========================================
// Failure records
// ==========================================

void NetworkRetry::record_failure(
    const std::string& key,
    const std::string& method,
    int attempt,
    const std::string& error,
    std::optional<int64_t> retry_after_ms
) {
    NetworkFailureContext context;
    context.url = key;
    context.method = method;
    context.attempts = attempt;
    context.last_error = error;
    context.timestamp = clock_.now();
    context.retry_after_ms = retry_after_ms;

    NetworkFailureHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[key] = context;
        handler = failure_handler_;
    }

    // Invoked outside the lock so handlers may query this object
    if (handler) {
        handler(context);
    }
}

void NetworkRetry::clear_failure(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.erase(key);
}

std::optional<NetworkFailureContext> NetworkRetry::failure(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = failures_.find(key);
    if (it == failures_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t NetworkRetry::failure_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_.size();
}

size_t NetworkRetry::prune_failures(std::chrono::milliseconds max_age) {
    const auto now = clock_.now();
    size_t removed = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = failures_.begin(); it != failures_.end();) {
        if (now - it->second.timestamp > max_age) {
            it = failures_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void NetworkRetry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.clear();
}

void NetworkRetry::set_failure_handler(NetworkFailureHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_handler_ = std::move(handler);
}

} // namespace gv
