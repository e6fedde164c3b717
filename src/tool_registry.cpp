#include "mcpsse/tool_registry.hpp"
#include "mcpsse/error.hpp"

namespace mcpsse {

ToolRegistry::ToolRegistry(std::vector<ToolDefinition> tools)
    : tools_(std::move(tools)) {
    index_.reserve(tools_.size());
    for (size_t i = 0; i < tools_.size(); ++i) {
        const std::string& name = tools_[i].name;
        if (name.empty()) {
            throw McpConfigError("Tool at position " + std::to_string(i) + " has an empty name");
        }
        if (!index_.emplace(name, i).second) {
            throw McpConfigError("Duplicate tool name: " + name);
        }
    }
}

bool ToolRegistry::exists(std::string_view name) const {
    return index_.count(std::string(name)) > 0;
}

const ToolDefinition* ToolRegistry::find(std::string_view name) const {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) return nullptr;
    return &tools_[it->second];
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(tools_.size());
    for (const auto& t : tools_) out.push_back(t.name);
    return out;
}

} // namespace mcpsse
