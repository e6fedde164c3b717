#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace mcpsse {

constexpr const char* LOGGER_NAME = "mcpsse";

/// Library-wide logger, created on first use with a colored stderr sink.
std::shared_ptr<spdlog::logger> logger();

/// Map "trace|debug|info|warn|error|critical|off" onto a spdlog level.
/// Throws McpConfigError for anything else.
spdlog::level::level_enum parse_log_level(const std::string& name);

void set_log_level(spdlog::level::level_enum level);

} // namespace mcpsse
