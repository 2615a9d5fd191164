#include "rapidmcp/router.hpp"
#include "rapidmcp/error.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace rapidmcp {

void Router::on_request(const std::string& method, RequestHandler handler) {
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    notification_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

std::optional<JsonRpcResponse> Router::dispatch(const JsonRpcMessage& msg) const {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        auto it = request_handlers_.find(req->method);
        if (it == request_handlers_.end()) {
            return make_error(req->id, error::MethodNotFound,
                              "Method not found: " + req->method,
                              nlohmann::json{{"method", req->method}});
        }

        nlohmann::json params = req->params ? *req->params : nlohmann::json::object();
        try {
            auto result = it->second(params);
            if (auto* err = std::get_if<JsonRpcError>(&result)) {
                JsonRpcResponse resp;
                resp.id = req->id;
                resp.error = std::move(*err);
                return resp;
            }
            return make_result(req->id, std::move(std::get<nlohmann::json>(result)));
        } catch (const McpProtocolError& e) {
            return make_error(req->id, e.code, e.what());
        } catch (const std::exception& e) {
            spdlog::error("{}: unexpected failure: {}", req->method, e.what());
            return make_error(req->id, error::InternalError, e.what());
        }
    }

    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        auto it = notification_handlers_.find(notif->method);
        if (it == notification_handlers_.end()) {
            spdlog::debug("ignoring notification {}", notif->method);
            return std::nullopt;
        }
        nlohmann::json params = notif->params ? *notif->params : nlohmann::json::object();
        try {
            it->second(params);
        } catch (const std::exception& e) {
            // Notifications never produce output, even on failure
            spdlog::warn("{}: notification handler failed: {}", notif->method, e.what());
        }
        return std::nullopt;
    }

    // Responses from the peer have no pending request to match against
    spdlog::debug("ignoring inbound response");
    return std::nullopt;
}

} // namespace rapidmcp
