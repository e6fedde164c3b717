#include "mcpsse/log.hpp"
#include "mcpsse/error.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mcpsse {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) return existing;
        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_pattern("[%Y-%m-%dT%H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return instance;
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn")     return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    throw McpConfigError("Unknown log level: " + name);
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace mcpsse
