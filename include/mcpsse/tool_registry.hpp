#pragma once
#include "types.hpp"
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mcpsse {

/// Immutable catalog of invocable tools.
///
/// Built once by the composition root and shared read-only with every
/// connection, so it carries no lock. Names are unique; construction with a
/// duplicate or empty name throws McpConfigError.
class ToolRegistry {
public:
    explicit ToolRegistry(std::vector<ToolDefinition> tools);

    /// Entries in insertion order.
    [[nodiscard]] const std::vector<ToolDefinition>& list() const noexcept {
        return tools_;
    }

    [[nodiscard]] bool exists(std::string_view name) const;

    /// Returns nullptr for unknown names.
    [[nodiscard]] const ToolDefinition* find(std::string_view name) const;

    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] size_t size() const noexcept { return tools_.size(); }

private:
    std::vector<ToolDefinition> tools_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace mcpsse
