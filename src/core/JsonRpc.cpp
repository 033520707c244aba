#include "JsonRpc.hpp"

namespace dify_bridge {

json make_success_response(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

json make_error_response(const json& id, const NormalizedError& error) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", error.to_json()}
    };
}

json make_error_response(const json& id, int code, const std::string& message) {
    return make_error_response(id, make_error(code, message));
}

json make_notification(const std::string& method, const json& params) {
    return {
        {"jsonrpc", "2.0"},
        {"method", method},
        {"params", params}
    };
}

json complete_response_frame(const json& response) {
    json frame = {{"jsonrpc", "2.0"}};
    frame["id"] = nullptr;

    if (response.is_object()) {
        if (response.contains("id")) {
            frame["id"] = response["id"];
        }
        if (response.contains("result")) {
            frame["result"] = response["result"];
        }
        if (response.contains("error")) {
            frame["error"] = response["error"];
        }
    }

    if (!frame.contains("result") && !frame.contains("error")) {
        frame["error"] = make_error(error_code::kInternalError, "Internal error: empty response").to_json();
    }
    return frame;
}

} // namespace dify_bridge
