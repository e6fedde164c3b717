#include "mcpsse/catalog.hpp"

namespace mcpsse {

std::vector<ToolDefinition> default_tools() {
    ToolDefinition search;
    search.name = "search";
    search.description = "Search for information in GoHighLevel CRM system";
    search.input_schema = {
        {"type", "object"},
        {"properties", {
            {"query", {{"type", "string"}, {"description", "Search query for GoHighLevel data"}}}
        }},
        {"required", {"query"}}
    };

    ToolDefinition retrieve;
    retrieve.name = "retrieve";
    retrieve.description = "Retrieve specific data from GoHighLevel";
    retrieve.input_schema = {
        {"type", "object"},
        {"properties", {
            {"id", {{"type", "string"}, {"description", "ID of the item to retrieve"}}},
            {"type", {
                {"type", "string"},
                {"enum", {"contact", "conversation", "blog"}},
                {"description", "Type of item to retrieve"}
            }}
        }},
        {"required", nlohmann::json::array({"id", "type"})}
    };

    return {std::move(search), std::move(retrieve)};
}

Implementation default_server_info() {
    return Implementation{"ghl-mcp-server", "1.0.0"};
}

} // namespace mcpsse
