#pragma once
#include "catalog.hpp"
#include "data_provider.hpp"
#include "json_rpc.hpp"
#include "router.hpp"
#include "tool_registry.hpp"
#include "types.hpp"
#include <optional>
#include <string>

namespace mcpsse {

/// MCP method handling on top of the Router: initialize, tools/list,
/// tools/call and ping.
///
/// The registry and the data provider are owned by the composition root
/// and must outlive the dispatcher. One dispatcher serves every connection,
/// so the provider must tolerate concurrent invoke() calls.
class Dispatcher {
public:
    struct Options {
        Implementation server_info = default_server_info();
        /// Validate tools/call arguments against the tool's inputSchema.
        bool strict_arguments = false;
    };

    Dispatcher(const ToolRegistry& registry, IDataProvider& provider);
    Dispatcher(const ToolRegistry& registry, IDataProvider& provider, Options opts);

    // Handlers capture `this`.
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Total: every failure is reported as an error response carrying the
    /// request's id.
    [[nodiscard]] JsonRpcResponse handle(const JsonRpcRequest& request) const;

    /// Requests yield a response; notifications and responses yield none.
    [[nodiscard]] std::optional<JsonRpcResponse> handle(const JsonRpcMessage& message) const;

    [[nodiscard]] const ToolRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] const Options& options() const noexcept { return opts_; }

private:
    void setup_handlers();

    HandlerResult on_initialize(const nlohmann::json& params) const;
    HandlerResult on_tools_list() const;
    HandlerResult on_tools_call(const nlohmann::json& params) const;

    const ToolRegistry& registry_;
    IDataProvider& provider_;
    Options opts_;
    Router router_;
};

} // namespace mcpsse
