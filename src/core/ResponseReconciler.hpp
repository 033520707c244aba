#pragma once

#include "NormalizedError.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace dify_bridge {

using json = nlohmann::ordered_json;

namespace payload_shape {

/// Server-initiated notification: method present, no id key
struct Notification {
    std::string method;
    json params;
};

/// Payload is not an object (scalar, array or null)
struct NonObject {};

/// Remote error, from an "error" field or a {message|status} shaped payload
struct Error {
    NormalizedError error;
    json id;
};

/// Object with neither result nor anything error-like
struct MissingResult {};

/// Well-formed result
struct Result {
    json result;
    json id;
};

} // namespace payload_shape

using PayloadShape = std::variant<
    payload_shape::Notification,
    payload_shape::NonObject,
    payload_shape::Error,
    payload_shape::MissingResult,
    payload_shape::Result>;

/**
 * @brief Frames produced for one remote payload
 *
 * The notification, when present, must be written before the response.
 */
struct Reconciliation {
    std::optional<json> notification;
    json response;
};

/**
 * @brief Turns untrusted remote payloads into valid JSON-RPC 2.0 frames
 *
 * Classification precedence, first match wins:
 *   1. method without id         -> notification + {ok: true} for the caller
 *   2. not an object             -> internal error
 *   3. non-null "error"          -> normalized error
 *   4. no result, message/status -> whole payload normalized as error
 *   5. no result                 -> internal error
 *   6. result                    -> success carrying only result
 */
class ResponseReconciler {
public:
    /**
     * @brief Classify a remote payload
     * @param payload Decoded remote body (any JSON)
     * @param fallback_id Id of the request that triggered the call
     */
    static PayloadShape classify(const json& payload, const json& fallback_id);

    /**
     * @brief Produce the outbound frames for a remote payload
     * @param payload Decoded remote body (any JSON)
     * @param fallback_id Id of the request that triggered the call
     */
    static Reconciliation reconcile(const json& payload, const json& fallback_id);

    /**
     * @brief Produce the outbound frames for an already classified payload
     */
    static Reconciliation reconcile(const PayloadShape& shape, const json& fallback_id);
};

} // namespace dify_bridge
