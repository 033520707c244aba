#pragma once

#include <nlohmann/json.hpp>

namespace dify_bridge {

using json = nlohmann::ordered_json;

/**
 * @brief Abstract interface for the local JSON-RPC transport
 *
 * Implementations deliver inbound messages one at a time, in order, and
 * write outbound frames without any other output on the protocol stream.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read next JSON-RPC message object from transport
     *
     * Input that is not a JSON object is skipped, never returned.
     *
     * @return JSON object, or null on end of input
     */
    virtual json read_message() = 0;

    /**
     * @brief Write one JSON-RPC frame to transport
     * @param message Response or notification
     */
    virtual void write_message(const json& message) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;
};

} // namespace dify_bridge
