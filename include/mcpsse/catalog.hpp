#pragma once
#include "types.hpp"
#include <vector>

namespace mcpsse {

/// The CRM tool catalog served by default: `search`, then `retrieve`.
std::vector<ToolDefinition> default_tools();

/// {"ghl-mcp-server", "1.0.0"}
Implementation default_server_info();

} // namespace mcpsse
