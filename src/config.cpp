#include "mcpsse/config.hpp"
#include "mcpsse/error.hpp"
#include "mcpsse/log.hpp"
#include "mcpsse/version.hpp"

#include <argparse/argparse.hpp>

#include <chrono>

namespace mcpsse {

namespace {

void require_positive(std::chrono::milliseconds value, const char* name) {
    if (value.count() <= 0) {
        throw McpConfigError(std::string(name) + " must be positive, got "
                             + std::to_string(value.count()) + " ms");
    }
}

} // anonymous namespace

void ServerConfig::validate() const {
    if (host.empty()) {
        throw McpConfigError("host must not be empty");
    }
    if (port == 0) {
        throw McpConfigError("port must be between 1 and 65535");
    }
    if (sse_path.empty() || sse_path.front() != '/') {
        throw McpConfigError("sse path must begin with '/', got '" + sse_path + "'");
    }
    if (max_connections <= 0) {
        throw McpConfigError("max connections must be positive");
    }
    parse_log_level(log_level);
    require_positive(timings.list_changed_delay, "list-changed delay");
    require_positive(timings.heartbeat_interval, "heartbeat interval");
    require_positive(timings.idle_timeout, "idle timeout");
    require_positive(timings.drain_delay, "drain delay");
}

ServerConfig ServerConfig::from_args(int argc, const char* const argv[]) {
    argparse::ArgumentParser program("mcpsse_server", std::string(LIBRARY_VERSION));

    program.add_argument("--host")
        .help("Address to listen on");
    program.add_argument("--port")
        .help("TCP port")
        .scan<'i', int>();
    program.add_argument("--path")
        .help("Path of the event-stream endpoint");
    program.add_argument("--max-connections")
        .help("Concurrent connections served")
        .scan<'i', int>();
    program.add_argument("--log-level")
        .help("trace, debug, info, warn, error, critical or off");
    program.add_argument("--strict")
        .help("Validate tools/call arguments against the tool input schema")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--heartbeat-ms")
        .help("Heartbeat interval of stream sessions")
        .scan<'i', int>();
    program.add_argument("--idle-timeout-ms")
        .help("Stream sessions are closed after this long")
        .scan<'i', int>();
    program.add_argument("--list-changed-delay-ms")
        .help("Delay before the tools/list_changed notification")
        .scan<'i', int>();
    program.add_argument("--drain-ms")
        .help("Delay between a posted response and closing its stream")
        .scan<'i', int>();

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        throw McpConfigError("CLI parse error: " + std::string(e.what()));
    }

    ServerConfig config;
    if (auto val = program.present("--host")) {
        config.host = *val;
    }
    if (auto val = program.present<int>("--port")) {
        if (*val < 1 || *val > 65535) {
            throw McpConfigError("port must be between 1 and 65535, got " + std::to_string(*val));
        }
        config.port = static_cast<uint16_t>(*val);
    }
    if (auto val = program.present("--path")) {
        config.sse_path = *val;
    }
    if (auto val = program.present<int>("--max-connections")) {
        config.max_connections = *val;
    }
    if (auto val = program.present("--log-level")) {
        config.log_level = *val;
    }
    config.strict_arguments = program.get<bool>("--strict");
    if (auto val = program.present<int>("--heartbeat-ms")) {
        config.timings.heartbeat_interval = std::chrono::milliseconds(*val);
    }
    if (auto val = program.present<int>("--idle-timeout-ms")) {
        config.timings.idle_timeout = std::chrono::milliseconds(*val);
    }
    if (auto val = program.present<int>("--list-changed-delay-ms")) {
        config.timings.list_changed_delay = std::chrono::milliseconds(*val);
    }
    if (auto val = program.present<int>("--drain-ms")) {
        config.timings.drain_delay = std::chrono::milliseconds(*val);
    }

    config.validate();
    return config;
}

SseHttpServer::Options ServerConfig::server_options() const {
    SseHttpServer::Options opts;
    opts.host = host;
    opts.port = port;
    opts.sse_path = sse_path;
    opts.max_connections = max_connections;
    opts.timings = timings;
    return opts;
}

Dispatcher::Options ServerConfig::dispatcher_options() const {
    Dispatcher::Options opts;
    opts.strict_arguments = strict_arguments;
    return opts;
}

} // namespace mcpsse
