#include "mcpsse/dispatcher.hpp"
#include "mcpsse/error.hpp"
#include "mcpsse/log.hpp"
#include "mcpsse/schema.hpp"
#include "mcpsse/version.hpp"

namespace mcpsse {

Dispatcher::Dispatcher(const ToolRegistry& registry, IDataProvider& provider)
    : Dispatcher(registry, provider, Options{}) {}

Dispatcher::Dispatcher(const ToolRegistry& registry, IDataProvider& provider, Options opts)
    : registry_(registry)
    , provider_(provider)
    , opts_(std::move(opts)) {
    setup_handlers();
}

void Dispatcher::setup_handlers() {
    router_.on_request("initialize", [this](const nlohmann::json& params) -> HandlerResult {
        return on_initialize(params);
    });

    router_.on_request("tools/list", [this](const nlohmann::json&) -> HandlerResult {
        return on_tools_list();
    });

    router_.on_request("tools/call", [this](const nlohmann::json& params) -> HandlerResult {
        return on_tools_call(params);
    });

    router_.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
        logger()->info("Handling ping request");
        return nlohmann::json::object();
    });

    router_.on_notification("notifications/initialized", [](const nlohmann::json&) {
        logger()->info("Client reported initialization complete");
    });
}

HandlerResult Dispatcher::on_initialize(const nlohmann::json& params) const {
    if (params.is_object() && params.contains("clientInfo")) {
        logger()->info("Handling initialize request from {}", params.at("clientInfo").dump());
    } else {
        logger()->info("Handling initialize request");
    }

    // The client's protocolVersion is not negotiated; mismatches are the
    // client's to handle.
    InitializeResult result;
    result.protocol_version = std::string(PROTOCOL_VERSION);
    result.capabilities.tools = nlohmann::json::object();
    result.server_info = opts_.server_info;

    nlohmann::json j;
    to_json(j, result);
    return j;
}

HandlerResult Dispatcher::on_tools_list() const {
    logger()->info("Handling tools/list request");
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& tool : registry_.list()) {
        nlohmann::json t;
        to_json(t, tool);
        tools.push_back(std::move(t));
    }
    return nlohmann::json{{"tools", std::move(tools)}};
}

HandlerResult Dispatcher::on_tools_call(const nlohmann::json& params) const {
    if (!params.is_object() || !params.contains("name") || !params.at("name").is_string()) {
        return JsonRpcError{error::MethodNotFound, "Method not found: missing tool name", std::nullopt};
    }
    const std::string name = params.at("name").get<std::string>();
    nlohmann::json arguments = params.contains("arguments")
        ? params.at("arguments")
        : nlohmann::json::object();

    logger()->info("Handling tools/call request: tool={} args={}", name, arguments.dump());

    const ToolDefinition* tool = registry_.find(name);
    if (!tool) {
        return JsonRpcError{error::MethodNotFound, "Method not found: " + name, std::nullopt};
    }

    if (opts_.strict_arguments) {
        auto violations = validate_arguments(tool->input_schema, arguments);
        if (!violations.empty()) {
            return JsonRpcError{
                error::InvalidRequest,
                "Invalid Request: arguments do not match the input schema of " + name,
                nlohmann::json(violations)
            };
        }
    }

    std::string text;
    try {
        text = provider_.invoke(name, arguments);
    } catch (const std::exception& e) {
        logger()->error("Data provider failed for tool {}: {}", name, e.what());
        return JsonRpcError{error::InternalError, "Internal error", nlohmann::json(e.what())};
    }

    CallToolResult result;
    result.content.push_back(TextContent{std::move(text)});
    nlohmann::json j;
    to_json(j, result);
    return j;
}

JsonRpcResponse Dispatcher::handle(const JsonRpcRequest& request) const {
    return router_.dispatch(request);
}

std::optional<JsonRpcResponse> Dispatcher::handle(const JsonRpcMessage& message) const {
    auto out = router_.dispatch(message);
    if (!out) return std::nullopt;
    if (auto* resp = std::get_if<JsonRpcResponse>(&*out)) {
        return std::move(*resp);
    }
    return std::nullopt;
}

} // namespace mcpsse
