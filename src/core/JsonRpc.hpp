#pragma once

#include "NormalizedError.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace dify_bridge {

using json = nlohmann::ordered_json;

/**
 * @brief Create JSON-RPC success response
 * @param id Request ID (or null)
 * @param result Result value
 */
json make_success_response(const json& id, const json& result);

/**
 * @brief Create JSON-RPC error response
 * @param id Request ID (or null)
 * @param error Normalized error
 */
json make_error_response(const json& id, const NormalizedError& error);

json make_error_response(const json& id, int code, const std::string& message);

/**
 * @brief Create JSON-RPC notification (no id)
 */
json make_notification(const std::string& method, const json& params);

/**
 * @brief Complete a response object into a frame that is safe to write
 *
 * Forces jsonrpc "2.0", fills a missing id with null, and keeps only
 * id/result/error. A response with neither result nor error is replaced
 * by an internal error.
 *
 * @param response Response-shaped object (any JSON)
 * @return Valid JSON-RPC 2.0 response
 */
json complete_response_frame(const json& response);

} // namespace dify_bridge
