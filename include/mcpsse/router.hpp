#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <optional>
#include <unordered_map>
#include <string>
#include <variant>

namespace mcpsse {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Method table for JSON-RPC messages.
///
/// Handlers are registered up front and the table is read-only while
/// serving, so dispatch takes no lock.
class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a notification handler.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Validate the envelope, route by method and run the handler.
    /// Never throws: failures become error responses.
    [[nodiscard]] JsonRpcResponse dispatch(const JsonRpcRequest& req) const;

    /// Run the notification handler, if any. Notifications are never answered.
    void dispatch(const JsonRpcNotification& notif) const;

    /// Dispatch an incoming message. Returns response if applicable.
    [[nodiscard]] std::optional<JsonRpcMessage> dispatch(const JsonRpcMessage& msg) const;

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace mcpsse
