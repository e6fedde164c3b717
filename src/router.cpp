#include "mcpsse/router.hpp"
#include "mcpsse/error.hpp"
#include "mcpsse/log.hpp"
#include "mcpsse/version.hpp"
#include <stdexcept>

namespace mcpsse {

void Router::on_request(const std::string& method, RequestHandler handler) {
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    notification_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

JsonRpcResponse Router::dispatch(const JsonRpcRequest& req) const {
    JsonRpcResponse resp;
    resp.id = req.id;

    logger()->info("Processing JSON-RPC message: method={} id={}", req.method, to_string(req.id));

    if (req.jsonrpc != JSONRPC_VERSION) {
        resp.error = JsonRpcError{
            error::InvalidRequest,
            "Invalid Request: jsonrpc must be '2.0'",
            std::nullopt
        };
        return resp;
    }

    auto it = request_handlers_.find(req.method);
    if (it == request_handlers_.end()) {
        resp.error = JsonRpcError{
            error::MethodNotFound,
            "Method not found: " + req.method,
            std::nullopt
        };
        return resp;
    }

    nlohmann::json params = req.params ? *req.params : nlohmann::json::object();
    try {
        auto result = it->second(params);
        if (auto* ok = std::get_if<nlohmann::json>(&result)) {
            resp.result = std::move(*ok);
        } else if (auto* err = std::get_if<JsonRpcError>(&result)) {
            resp.error = std::move(*err);
        }
    } catch (const McpProtocolError& e) {
        resp.error = JsonRpcError{e.code, e.what(), e.data};
    } catch (const std::exception& e) {
        logger()->error("Error processing message {}: {}", req.method, e.what());
        resp.error = JsonRpcError{error::InternalError, "Internal error", nlohmann::json(e.what())};
    } catch (...) {
        logger()->error("Error processing message {}: non-standard exception", req.method);
        resp.error = JsonRpcError{error::InternalError, "Internal error",
                                  nlohmann::json("unknown exception")};
    }
    return resp;
}

void Router::dispatch(const JsonRpcNotification& notif) const {
    if (notif.jsonrpc != JSONRPC_VERSION) {
        logger()->warn("Dropping notification {} with jsonrpc '{}'", notif.method, notif.jsonrpc);
        return;
    }
    auto it = notification_handlers_.find(notif.method);
    if (it == notification_handlers_.end()) {
        logger()->debug("No handler for notification {}", notif.method);
        return;
    }
    nlohmann::json params = notif.params ? *notif.params : nlohmann::json::object();
    try {
        it->second(params);
    } catch (const std::exception& e) {
        // Notifications don't return responses
        logger()->error("Notification handler {} failed: {}", notif.method, e.what());
    }
}

std::optional<JsonRpcMessage> Router::dispatch(const JsonRpcMessage& msg) const {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        return JsonRpcMessage{dispatch(*req)};
    }
    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        dispatch(*notif);
        return std::nullopt;
    }
    // Responses are not dispatched: this server never issues requests.
    logger()->debug("Ignoring inbound response");
    return std::nullopt;
}

} // namespace mcpsse
