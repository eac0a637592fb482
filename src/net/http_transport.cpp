#include "net/http_transport.hpp"
#include "core/errors.hpp"
#include <curl/curl.h>
#include <mutex>

namespace gv {

// ============================================================================
// Helper Functions for HTTP Requests
// ============================================================================

namespace {

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

std::once_flag curl_init_flag;

} // anonymous namespace

// ============================================================================
// CurlTransport
// ============================================================================

CurlTransport::CurlTransport() {
    // curl_easy_init would do this lazily, but not thread-safely
    std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlTransport::perform(
    const HttpRequest& request,
    std::chrono::milliseconds timeout
) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TransportError("Failed to initialize CURL");
    }

    HttpResponse response;
    struct curl_slist* header_list = nullptr;

    // Add headers; Accept-Encoding is handed to curl so it can decode the body
    bool wants_compression = false;
    for (const auto& header : request.headers) {
        if (header.rfind("Accept-Encoding:", 0) == 0) {
            wants_compression = true;
            continue;
        }
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    if (wants_compression) {
        // Empty string: advertise every encoding this libcurl build can decode
        curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    }

    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    CURLcode res = curl_easy_perform(curl);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        if (res == CURLE_OPERATION_TIMEDOUT) {
            throw TimeoutError("Request to " + request.url + " timed out after " +
                               std::to_string(timeout.count()) + "ms");
        }
        throw TransportError("CURL request failed: " + error);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_easy_cleanup(curl);

    return response;
}

} // namespace gv
