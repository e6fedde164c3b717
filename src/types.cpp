#include "mcpsse/types.hpp"

namespace mcpsse {

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}};
    if (t.description) j["description"] = *t.description;
    j["inputSchema"] = t.input_schema;
}

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = nlohmann::json::array();
    for (const auto& c : t.content) {
        nlohmann::json cj;
        to_json(cj, c);
        j["content"].push_back(cj);
    }
}

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = nlohmann::json::object();
    j["protocolVersion"] = t.protocol_version;
    j["capabilities"] = t.capabilities;
    j["serverInfo"] = t.server_info;
}

} // namespace mcpsse
