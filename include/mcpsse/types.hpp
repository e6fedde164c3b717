#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace mcpsse {

// ---------- Content ----------

struct TextContent {
    std::string text;
};

// ---------- Tool ----------

struct ToolDefinition {
    std::string name;
    std::optional<std::string> description;
    nlohmann::json input_schema;
};

struct CallToolResult {
    std::vector<TextContent> content;
};

// ---------- Lifecycle ----------

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
};

struct Implementation {
    std::string name;
    std::string version;
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
};

// ---------- JSON serialization ----------
// Outbound only: the server never decodes these from the wire.

void to_json(nlohmann::json& j, const TextContent& t);
void to_json(nlohmann::json& j, const ToolDefinition& t);
void to_json(nlohmann::json& j, const CallToolResult& t);
void to_json(nlohmann::json& j, const ServerCapabilities& t);
void to_json(nlohmann::json& j, const Implementation& t);
void to_json(nlohmann::json& j, const InitializeResult& t);

} // namespace mcpsse
