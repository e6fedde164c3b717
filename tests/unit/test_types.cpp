#include <gtest/gtest.h>
#include "mcpsse/types.hpp"
#include <nlohmann/json.hpp>

using namespace mcpsse;

// ---- TextContent ----

TEST(TextContent, Serialize) {
    TextContent tc;
    tc.text = "Hello, world!";

    nlohmann::json j;
    to_json(j, tc);
    EXPECT_EQ(j, (nlohmann::json{{"type", "text"}, {"text", "Hello, world!"}}));
}

// ---- ToolDefinition ----

TEST(ToolDefinition, SerializeUsesCamelCaseSchemaKey) {
    ToolDefinition td;
    td.name = "search";
    td.description = "Search for things";
    td.input_schema = {{"type", "object"}, {"required", {"query"}}};

    nlohmann::json j = td;
    EXPECT_EQ(j["name"], "search");
    EXPECT_EQ(j["description"], "Search for things");
    EXPECT_EQ(j["inputSchema"]["type"], "object");
    EXPECT_FALSE(j.contains("input_schema"));
}

TEST(ToolDefinition, DescriptionIsOptional) {
    ToolDefinition td;
    td.name = "bare";
    td.input_schema = {{"type", "object"}};

    nlohmann::json j = td;
    EXPECT_FALSE(j.contains("description"));
    EXPECT_EQ(j.size(), 2u);
}

// ---- CallToolResult ----

TEST(CallToolResult, ContentArray) {
    CallToolResult r;
    r.content.push_back(TextContent{"first"});
    r.content.push_back(TextContent{"second"});

    nlohmann::json j = r;
    ASSERT_EQ(j["content"].size(), 2u);
    EXPECT_EQ(j["content"][0]["type"], "text");
    EXPECT_EQ(j["content"][1]["text"], "second");
    EXPECT_EQ(j.size(), 1u);
}

// ---- Lifecycle ----

TEST(ServerCapabilities, EmptyToolsObject) {
    ServerCapabilities caps;
    caps.tools = nlohmann::json::object();

    nlohmann::json j = caps;
    EXPECT_EQ(j, (nlohmann::json{{"tools", nlohmann::json::object()}}));
}

TEST(ServerCapabilities, NoTools) {
    nlohmann::json j = ServerCapabilities{};
    EXPECT_TRUE(j.is_object());
    EXPECT_TRUE(j.empty());
}

TEST(InitializeResult, Serialize) {
    InitializeResult r;
    r.protocol_version = "2024-11-05";
    r.capabilities.tools = nlohmann::json::object();
    r.server_info = Implementation{"ghl-mcp-server", "1.0.0"};

    nlohmann::json j = r;
    EXPECT_EQ(j["protocolVersion"], "2024-11-05");
    EXPECT_EQ(j["capabilities"]["tools"], nlohmann::json::object());
    EXPECT_EQ(j["serverInfo"], (nlohmann::json{{"name", "ghl-mcp-server"}, {"version", "1.0.0"}}));
    EXPECT_EQ(j.size(), 3u);
}
