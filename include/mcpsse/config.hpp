#pragma once
#include "dispatcher.hpp"
#include "session.hpp"
#include "transport/sse_http_server.hpp"
#include <cstdint>
#include <string>

namespace mcpsse {

/// Everything the server executable can be told from the command line.
/// Defaults match the production deployment.
struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 3000;
    std::string sse_path = "/sse";
    int max_connections = 100;
    std::string log_level = "info";
    bool strict_arguments = false;
    SessionTimings timings;

    /// Throws McpConfigError describing the first invalid field.
    void validate() const;

    /// Parse command-line flags on top of the defaults and validate.
    /// Throws McpConfigError on unknown flags or bad values.
    static ServerConfig from_args(int argc, const char* const argv[]);

    [[nodiscard]] SseHttpServer::Options server_options() const;
    [[nodiscard]] Dispatcher::Options dispatcher_options() const;
};

} // namespace mcpsse
