#include "BridgeSession.hpp"
#include "core/JsonRpc.hpp"
#include "core/ToolNameSanitizer.hpp"
#include <stdexcept>

namespace dify_bridge {

namespace {

bool has_non_null(const json& payload, const char* key) {
    return payload.is_object() && payload.contains(key) && !payload[key].is_null();
}

} // namespace

BridgeSession::BridgeSession(std::unique_ptr<ITransport> transport,
                             std::unique_ptr<RemoteInvoker> invoker,
                             std::shared_ptr<spdlog::logger> logger)
    : transport_(std::move(transport)), invoker_(std::move(invoker)), logger_(std::move(logger)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    if (!invoker_) {
        throw std::invalid_argument("Remote invoker cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null");
    }
}

void BridgeSession::run() {
    logger_->debug("BridgeSession starting main loop");

    while (transport_->is_open()) {
        json message = transport_->read_message();

        // Null indicates end of input
        if (message.is_null()) {
            logger_->info("Input closed, stopping bridge");
            break;
        }

        handle_message(message);
    }

    logger_->debug("BridgeSession stopped");
}

void BridgeSession::handle_message(const json& message) {
    json id = message.is_object() && message.contains("id") ? message["id"] : json();

    try {
        const bool valid_method = message.is_object() && message.contains("method") &&
                                  message["method"].is_string() &&
                                  !message["method"].get_ref<const std::string&>().empty();
        if (!valid_method) {
            send_response(make_error_response(id, error_code::kInvalidRequest,
                                              "Invalid Request: missing method"));
            return;
        }

        const std::string& method = message["method"].get_ref<const std::string&>();
        logger_->debug("Handling message: method={}, id={}", method, id.dump());

        if (method == "initialize") {
            handle_initialize(message, id);
        } else {
            handle_forward(message, id);
        }
    } catch (const std::exception& e) {
        logger_->error("Error handling message: {}", e.what());
        send_response(make_error_response(id, error_code::kInternalError,
                                          std::string("Internal error: ") + e.what()));
    }
}

void BridgeSession::handle_initialize(const json& message, const json& id) {
    json remote = invoker_->forward(message, id);

    if (has_non_null(remote, "result")) {
        state_ = SessionState::Initialized;
        send_reconciled(ResponseReconciler::reconcile(sanitize_payload(std::move(remote)), id));
        return;
    }

    state_ = SessionState::Initialized;
    send_response(make_success_response(id, local_initialize_result()));

    if (has_non_null(remote, "error")) {
        const json& error = remote["error"];
        std::string reason = "unknown";
        if (error.is_object() && error.contains("message") && error["message"].is_string() &&
            !error["message"].get_ref<const std::string&>().empty()) {
            reason = error["message"].get<std::string>();
        }

        logger_->warn("Remote initialize failed, returning local minimal initialize. Remote error: {}",
                      error.dump());
        send_notification(make_notification("notifications/message", {
            {"level", "warning"},
            {"message", "dify-bridge: remote initialize failed (" + reason + ")"}
        }));
        return;
    }

    logger_->warn("Remote initialize returned neither result nor error, returning local minimal initialize");
}

void BridgeSession::handle_forward(const json& message, const json& id) {
    json remote = invoker_->forward(message, id);
    send_reconciled(ResponseReconciler::reconcile(sanitize_payload(std::move(remote)), id));
}

json BridgeSession::sanitize_payload(json payload) {
    if (has_non_null(payload, "result")) {
        payload["result"] = ToolNameSanitizer::sanitize_result(payload["result"]);
    }
    return payload;
}

json BridgeSession::local_initialize_result() {
    return {
        {"protocolVersion", kProtocolVersion},
        {"serverInfo", {
            {"name", kServerName},
            {"version", kServerVersion}
        }},
        {"capabilities", json::object()},
        {"tools", json::array()}
    };
}

void BridgeSession::send_reconciled(const Reconciliation& reconciled) {
    if (reconciled.notification) {
        send_notification(*reconciled.notification);
    }
    send_response(reconciled.response);
}

void BridgeSession::send_response(const json& response) {
    transport_->write_message(complete_response_frame(response));
}

void BridgeSession::send_notification(const json& notification) {
    transport_->write_message(notification);
}

} // namespace dify_bridge
