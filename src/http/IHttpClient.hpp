#pragma once

#include <map>
#include <string>

namespace dify_bridge {

/**
 * @brief Outbound HTTP POST request
 */
struct HttpRequest {
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    long timeout_ms = 60000;
};

/**
 * @brief Result of an HTTP exchange
 *
 * transport_ok is false when no HTTP response was received (connection
 * failure, DNS failure, timeout); error then describes the failure.
 */
struct HttpResponse {
    bool transport_ok = false;
    bool timed_out = false;
    std::string error;
    long status = 0;
    std::string content_type;
    std::string body;

    bool is_success() const { return transport_ok && status >= 200 && status < 300; }
};

/**
 * @brief Abstract interface for HTTP clients
 *
 * Implementations never throw for network failures; they report them
 * through HttpResponse.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief Perform a single POST request, blocking until done or timed out
     */
    virtual HttpResponse post(const HttpRequest& request) = 0;
};

} // namespace dify_bridge
