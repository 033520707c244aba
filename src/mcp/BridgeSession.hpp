#pragma once

#include "ITransport.hpp"
#include "core/ResponseReconciler.hpp"
#include "http/RemoteInvoker.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace dify_bridge {

/**
 * @brief Handshake state of a bridge session
 *
 * Observational only: no request is rejected while uninitialized.
 */
enum class SessionState {
    Uninitialized,
    Initialized
};

/**
 * @brief Bridges a local JSON-RPC transport to the remote MCP service
 *
 * Processes one message at a time: forward to the remote, decode, sanitize
 * tool names, reconcile into valid JSON-RPC frames, write. The initialize
 * handshake falls back to a minimal local answer when the remote fails.
 */
class BridgeSession {
public:
    static constexpr const char* kProtocolVersion = "2024-11-05";
    static constexpr const char* kServerName = "dify-mcp-bridge";
    static constexpr const char* kServerVersion = "1.0.0";

    /**
     * @brief Construct session
     * @param transport Local transport (owned)
     * @param invoker Remote invoker (owned)
     * @param logger Diagnostics sink (defaults to the default logger)
     */
    BridgeSession(std::unique_ptr<ITransport> transport,
                  std::unique_ptr<RemoteInvoker> invoker,
                  std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @brief Start session main loop
     *
     * Blocks until the transport reaches end of input.
     */
    void run();

    /**
     * @brief Handle one inbound message and write its frames
     * @param message Inbound JSON object
     */
    void handle_message(const json& message);

    SessionState state() const { return state_; }

    /**
     * @brief Result of the local minimal initialize answer
     */
    static json local_initialize_result();

private:
    void handle_initialize(const json& message, const json& id);
    void handle_forward(const json& message, const json& id);

    /**
     * @brief Sanitize tool names inside payload["result"], if any
     */
    static json sanitize_payload(json payload);

    void send_reconciled(const Reconciliation& reconciled);
    void send_response(const json& response);
    void send_notification(const json& notification);

    std::unique_ptr<ITransport> transport_;
    std::unique_ptr<RemoteInvoker> invoker_;
    std::shared_ptr<spdlog::logger> logger_;
    SessionState state_{SessionState::Uninitialized};
};

} // namespace dify_bridge
