#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace dify_bridge {

using json = nlohmann::ordered_json;

/**
 * @brief JSON-RPC error codes emitted by the bridge
 */
namespace error_code {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kInternalError = -32603;
constexpr int kRemoteError = -32000;
constexpr int kNetworkError = -32098;
} // namespace error_code

/**
 * @brief Canonical error shape for every failure surfaced on the local transport
 */
struct NormalizedError {
    int code = error_code::kRemoteError;
    std::string message;
    json data;
    bool has_data = false;

    /**
     * @brief Serialize to a JSON-RPC error object ({code, message, data?})
     */
    json to_json() const;
};

/**
 * @brief Build an error with auxiliary data attached
 */
NormalizedError make_error(int code, const std::string& message, const json& data);

/**
 * @brief Build an error without auxiliary data
 */
NormalizedError make_error(int code, const std::string& message);

/**
 * @brief Coerce a remote error of unknown shape into a NormalizedError
 *
 * Code comes from "code" or "status" (default -32000), message from
 * "message", "error" or "reason" (default "Remote error"), and "data"
 * is carried through unchanged when present. Non-object values become
 * the message of a -32000 error.
 *
 * @param err Remote error value (any JSON)
 * @return Normalized error
 */
NormalizedError normalize_remote_error(const json& err);

/**
 * @brief Render a JSON value the way it reads in a message string
 *
 * Strings are returned without quotes, everything else as compact JSON.
 */
std::string json_to_text(const json& value);

} // namespace dify_bridge
