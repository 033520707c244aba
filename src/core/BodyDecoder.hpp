#pragma once

#include "NormalizedError.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace dify_bridge {

using json = nlohmann::ordered_json;

/**
 * @brief Outcome of decoding a remote body: a JSON value or a parse error
 */
using DecodeResult = std::variant<json, NormalizedError>;

/**
 * @brief Decodes remote HTTP response bodies into JSON values
 *
 * Bodies are either plain JSON or a server-sent event stream whose last
 * data payload carries the JSON-RPC message. Decoding strategies are
 * tried in order (stream first when the content type announces it, JSON
 * first otherwise) and the first success wins.
 */
class BodyDecoder {
public:
    /**
     * @brief Decode a response body
     * @param body Raw response text
     * @param content_type Declared Content-Type header (may be empty)
     * @return Decoded value, or a -32700 error carrying the raw body
     */
    static DecodeResult decode(const std::string& body, const std::string& content_type);

    /**
     * @brief Check whether a content type announces an event stream
     */
    static bool is_event_stream(const std::string& content_type);

    /**
     * @brief Decode the body as a single JSON document
     * @return Parsed value, or nullopt if the text is not valid JSON
     */
    static std::optional<json> decode_json(const std::string& body);

    /**
     * @brief Decode the body as an event stream
     *
     * The last non-empty "data:" line in the whole body wins. If no data
     * line starts a line but the marker appears somewhere, the last
     * "data: {...}" span is extracted heuristically. A payload that
     * decodes to a JSON string is decoded once more.
     *
     * @return Parsed non-null value, or nullopt if nothing usable was found
     */
    static std::optional<json> decode_event_stream(const std::string& body);

    /**
     * @brief Extract the raw data payload of an event stream body
     * @return Last data payload text, or nullopt if none
     */
    static std::optional<std::string> extract_last_data(const std::string& body);
};

} // namespace dify_bridge
