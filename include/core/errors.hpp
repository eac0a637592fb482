#pragma once

#include <stdexcept>
#include <string>

namespace gv {

// ============================================================================
// Error Taxonomy
// ============================================================================

/**
 * @brief Base class for every failure of a network call
 *
 * All subclasses are retryable by default; see RetryPolicy::should_retry.
 */
class NetworkError : public std::runtime_error {
public:
    explicit NetworkError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief The request failed before any response was received
 */
class TransportError : public NetworkError {
public:
    explicit TransportError(const std::string& message)
        : NetworkError(message) {}
};

/**
 * @brief A response arrived with a non-2xx status
 */
class HttpStatusError : public NetworkError {
public:
    HttpStatusError(long status, const std::string& message)
        : NetworkError("HTTP " + std::to_string(status) + ": " + message),
          status_(status) {}

    long status() const { return status_; }

private:
    long status_;
};

/**
 * @brief A deadline was exceeded
 *
 * Raised for network calls that hit their timeout and for queued
 * operations that did not finish in time.
 */
class TimeoutError : public NetworkError {
public:
    explicit TimeoutError(const std::string& message)
        : NetworkError(message) {}
};

/**
 * @brief Work was abandoned because its owner no longer wants the result
 */
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace gv
