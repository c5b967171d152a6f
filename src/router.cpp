#include "mdmcp/router.hpp"
#include "mdmcp/error.hpp"
#include <spdlog/spdlog.h>

namespace mdmcp {

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

JsonRpcResponse Router::dispatch(const JsonRpcRequest& req) const {
    RequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = request_handlers_.find(req.method);
        if (it == request_handlers_.end()) {
            return make_error_response(req.id, error::MethodNotFound,
                                       "Method not found: " + req.method);
        }
        handler = it->second;
    }

    nlohmann::json params = req.params ? *req.params : nlohmann::json::object();

    // Handlers run without the lock; a slow conversion must not block lookups.
    try {
        auto result = handler(params);

        JsonRpcResponse resp;
        resp.id = req.id;
        if (auto* ok = std::get_if<nlohmann::json>(&result)) {
            resp.result = std::move(*ok);
        } else {
            resp.error = std::get<JsonRpcError>(std::move(result));
        }
        return resp;
    } catch (const McpProtocolError& e) {
        return make_error_response(req.id, e.code, e.what());
    } catch (const nlohmann::json::exception& e) {
        return make_error_response(req.id, error::InvalidParams,
                                   std::string("Invalid params: ") + e.what());
    } catch (const std::exception& e) {
        spdlog::error("Handler for '{}' failed: {}", req.method, e.what());
        return make_error_response(req.id, error::InternalError, e.what());
    }
}

bool Router::dispatch(const JsonRpcNotification& notif) const {
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = notification_handlers_.find(notif.method);
        if (it == notification_handlers_.end()) return false;
        handler = it->second;
    }
    try {
        handler(notif.params ? *notif.params : nlohmann::json::object());
    } catch (const std::exception& e) {
        // Notifications have no response channel.
        spdlog::warn("Notification handler for '{}' failed: {}", notif.method, e.what());
    }
    return true;
}

} // namespace mdmcp
