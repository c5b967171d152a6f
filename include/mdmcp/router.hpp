#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>

namespace mdmcp {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Method-name table for one session. Request handlers may report failure by
/// returning a JsonRpcError or by throwing; dispatch turns either into an
/// error response carrying the request id.
class Router {
public:
    void on_request(const std::string& method, RequestHandler handler);
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Always returns a response; unknown methods get MethodNotFound.
    [[nodiscard]] JsonRpcResponse dispatch(const JsonRpcRequest& req) const;

    /// Returns false when no handler is registered for the method.
    bool dispatch(const JsonRpcNotification& notif) const;

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace mdmcp
