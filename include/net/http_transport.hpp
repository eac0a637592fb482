#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace gv {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Outgoing HTTP request
 */
struct HttpRequest {
    std::string method = "GET";             ///< GET or POST
    std::string url;
    std::vector<std::string> headers;       ///< "Name: value" lines
    std::string body;                       ///< POST payload
};

/**
 * @brief Response as received; non-2xx statuses are not errors at this layer
 */
struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// ============================================================================
// Transport Interface
// ============================================================================

/**
 * @brief Abstract HTTP transport
 *
 * Implementations throw TransportError when no response was received and
 * TimeoutError when the deadline passed. They must be safe to call from
 * several threads at once.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse perform(
        const HttpRequest& request,
        std::chrono::milliseconds timeout
    ) = 0;
};

/**
 * @brief libcurl-backed transport; one easy handle per request
 */
class CurlTransport : public HttpTransport {
public:
    CurlTransport();

    HttpResponse perform(
        const HttpRequest& request,
        std::chrono::milliseconds timeout
    ) override;
};

} // namespace gv
