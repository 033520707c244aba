#include "ResponseReconciler.hpp"
#include "JsonRpc.hpp"

namespace dify_bridge {

namespace {

json own_or_fallback_id(const json& payload, const json& fallback_id) {
    if (payload.contains("id") && !payload["id"].is_null()) {
        return payload["id"];
    }
    return fallback_id;
}

} // namespace

PayloadShape ResponseReconciler::classify(const json& payload, const json& fallback_id) {
    if (payload.is_object() && payload.contains("method") && !payload.contains("id")) {
        const json& method = payload["method"];
        payload_shape::Notification notification;
        notification.method = method.is_string() ? method.get<std::string>() : "remote/notification";
        notification.params = json::object();
        if (payload.contains("params") && payload["params"].is_object()) {
            notification.params = payload["params"];
        }
        return notification;
    }

    if (!payload.is_object()) {
        return payload_shape::NonObject{};
    }

    if (payload.contains("error") && !payload["error"].is_null()) {
        return payload_shape::Error{normalize_remote_error(payload["error"]),
                                    own_or_fallback_id(payload, fallback_id)};
    }

    const bool has_result = payload.contains("result");

    // Some remotes answer {status, message} instead of a JSON-RPC error
    if (!has_result && (payload.contains("message") || payload.contains("status"))) {
        return payload_shape::Error{normalize_remote_error(payload),
                                    own_or_fallback_id(payload, fallback_id)};
    }

    if (!has_result) {
        return payload_shape::MissingResult{};
    }

    return payload_shape::Result{payload["result"], own_or_fallback_id(payload, fallback_id)};
}

Reconciliation ResponseReconciler::reconcile(const json& payload, const json& fallback_id) {
    return reconcile(classify(payload, fallback_id), fallback_id);
}

Reconciliation ResponseReconciler::reconcile(const PayloadShape& shape, const json& fallback_id) {
    Reconciliation out;

    if (const auto* notification = std::get_if<payload_shape::Notification>(&shape)) {
        out.notification = make_notification(notification->method, notification->params);
        out.response = make_success_response(fallback_id, {{"ok", true}});
    } else if (std::holds_alternative<payload_shape::NonObject>(shape)) {
        out.response = make_error_response(fallback_id, error_code::kInternalError,
                                           "Remote returned non-object");
    } else if (const auto* error = std::get_if<payload_shape::Error>(&shape)) {
        out.response = make_error_response(error->id, error->error);
    } else if (std::holds_alternative<payload_shape::MissingResult>(shape)) {
        out.response = make_error_response(fallback_id, error_code::kInternalError,
                                           "Remote missing result and error");
    } else {
        const auto& result = std::get<payload_shape::Result>(shape);
        // Only result survives; transport-specific top-level fields are dropped
        out.response = make_success_response(result.id, result.result);
    }

    return out;
}

} // namespace dify_bridge
