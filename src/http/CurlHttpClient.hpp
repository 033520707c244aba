#pragma once

#include "IHttpClient.hpp"

namespace dify_bridge {

/**
 * @brief IHttpClient backed by the libcurl easy interface
 *
 * One easy handle per request; no connection reuse, no retries, no
 * redirects.
 */
class CurlHttpClient : public IHttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse post(const HttpRequest& request) override;
};

} // namespace dify_bridge
