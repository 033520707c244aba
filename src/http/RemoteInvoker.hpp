#pragma once

#include "IHttpClient.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace dify_bridge {

using json = nlohmann::ordered_json;

/**
 * @brief Endpoint settings for the remote MCP service
 */
struct RemoteEndpoint {
    std::string url;
    std::string token;
    long timeout_ms = 60000;
};

/**
 * @brief Forwards JSON-RPC messages to the remote service over HTTP
 *
 * Every failure (network, timeout, HTTP status, undecodable body) is
 * turned into a JSON-RPC error response addressed to the caller's id;
 * nothing is thrown past this class.
 */
class RemoteInvoker {
public:
    /**
     * @brief Construct invoker
     * @param client HTTP client implementation
     * @param endpoint Remote URL, bearer token and timeout
     * @param logger Diagnostics sink (defaults to the default logger)
     */
    RemoteInvoker(std::shared_ptr<IHttpClient> client,
                  RemoteEndpoint endpoint,
                  std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @brief POST a message to the remote and decode the reply
     * @param message JSON-RPC message, sent as the request body
     * @param fallback_id Id used for error responses built locally
     * @return Decoded remote payload, or a locally built error response
     */
    json forward(const json& message, const json& fallback_id);

private:
    HttpRequest build_request(const json& message) const;

    std::shared_ptr<IHttpClient> client_;
    RemoteEndpoint endpoint_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace dify_bridge
