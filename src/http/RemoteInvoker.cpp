#include "RemoteInvoker.hpp"
#include "core/BodyDecoder.hpp"
#include "core/JsonRpc.hpp"
#include <stdexcept>

namespace dify_bridge {

RemoteInvoker::RemoteInvoker(std::shared_ptr<IHttpClient> client,
                             RemoteEndpoint endpoint,
                             std::shared_ptr<spdlog::logger> logger)
    : client_(std::move(client)), endpoint_(std::move(endpoint)), logger_(std::move(logger)) {
    if (!client_) {
        throw std::invalid_argument("HTTP client cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null");
    }
}

HttpRequest RemoteInvoker::build_request(const json& message) const {
    HttpRequest request;
    request.url = endpoint_.url;
    request.headers = {
        {"Content-Type", "application/json"},
        {"Authorization", "Bearer " + endpoint_.token},
        {"Accept", "application/json, text/event-stream"}
    };
    request.body = message.dump();
    request.timeout_ms = endpoint_.timeout_ms;
    return request;
}

json RemoteInvoker::forward(const json& message, const json& fallback_id) {
    HttpResponse response = client_->post(build_request(message));

    if (!response.transport_ok) {
        logger_->warn("Network error forwarding to remote MCP{}: {}",
                      response.timed_out ? " (timeout)" : "", response.error);
        return make_error_response(fallback_id,
                                   make_error(error_code::kNetworkError,
                                              "Network error forwarding to remote MCP",
                                              response.error));
    }

    if (!response.is_success()) {
        logger_->warn("Remote MCP error {}", response.status);
        return make_error_response(fallback_id,
                                   make_error(error_code::kRemoteError,
                                              "Remote MCP error " + std::to_string(response.status),
                                              response.body));
    }

    DecodeResult decoded = BodyDecoder::decode(response.body, response.content_type);
    if (const auto* error = std::get_if<NormalizedError>(&decoded)) {
        logger_->warn("{} from remote (content-type '{}')", error->message, response.content_type);
        return make_error_response(fallback_id, *error);
    }
    return std::get<json>(std::move(decoded));
}

} // namespace dify_bridge
