#include <gtest/gtest.h>
#include "mcpsse/tool_registry.hpp"
#include "mcpsse/catalog.hpp"
#include "mcpsse/error.hpp"

using namespace mcpsse;

namespace {

ToolDefinition make_tool(const std::string& name) {
    ToolDefinition t;
    t.name = name;
    t.input_schema = {{"type", "object"}};
    return t;
}

} // anonymous namespace

TEST(ToolRegistry, DefaultCatalogOrder) {
    ToolRegistry registry(default_tools());
    ASSERT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.list()[0].name, "search");
    EXPECT_EQ(registry.list()[1].name, "retrieve");
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"search", "retrieve"}));
}

TEST(ToolRegistry, ListIsStable) {
    ToolRegistry registry(default_tools());
    nlohmann::json first = registry.list();
    nlohmann::json second = registry.list();
    EXPECT_EQ(first.dump(), second.dump());
}

TEST(ToolRegistry, Exists) {
    ToolRegistry registry(default_tools());
    EXPECT_TRUE(registry.exists("search"));
    EXPECT_TRUE(registry.exists("retrieve"));
    EXPECT_FALSE(registry.exists("delete"));
    EXPECT_FALSE(registry.exists(""));
    EXPECT_FALSE(registry.exists("Search"));
}

TEST(ToolRegistry, Find) {
    ToolRegistry registry(default_tools());
    const ToolDefinition* retrieve = registry.find("retrieve");
    ASSERT_NE(retrieve, nullptr);
    EXPECT_EQ(retrieve->input_schema["required"], nlohmann::json::array({"id", "type"}));
    EXPECT_EQ(retrieve->input_schema["properties"]["type"]["enum"],
              (nlohmann::json{"contact", "conversation", "blog"}));
    EXPECT_EQ(registry.find("missing"), nullptr);
}

TEST(ToolRegistry, DuplicateNameThrows) {
    std::vector<ToolDefinition> tools = {make_tool("a"), make_tool("b"), make_tool("a")};
    EXPECT_THROW(ToolRegistry{std::move(tools)}, McpConfigError);
}

TEST(ToolRegistry, EmptyNameThrows) {
    std::vector<ToolDefinition> tools = {make_tool("")};
    EXPECT_THROW(ToolRegistry{std::move(tools)}, McpConfigError);
}

TEST(ToolRegistry, EmptyRegistry) {
    ToolRegistry registry(std::vector<ToolDefinition>{});
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(registry.list().empty());
    EXPECT_FALSE(registry.exists("search"));
}

TEST(Catalog, ServerInfo) {
    auto info = default_server_info();
    EXPECT_EQ(info.name, "ghl-mcp-server");
    EXPECT_EQ(info.version, "1.0.0");
}
