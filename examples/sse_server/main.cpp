/// CRM tool server: MCP over a server-sent event stream.
/// Usage: ./mcpsse_server [--port 3000] [--path /sse] [--strict] ...
/// GET /sse opens a stream, POST /sse answers one JSON-RPC message.

#include <mcpsse/mcpsse.hpp>

#include <iostream>

int main(int argc, char* argv[]) {
    mcpsse::ServerConfig config;
    try {
        config = mcpsse::ServerConfig::from_args(argc, argv);
    } catch (const mcpsse::McpConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    mcpsse::set_log_level(mcpsse::parse_log_level(config.log_level));

    mcpsse::ToolRegistry registry{mcpsse::default_tools()};
    mcpsse::StubDataProvider provider;
    mcpsse::Dispatcher dispatcher{registry, provider, config.dispatcher_options()};
    mcpsse::SseHttpServer server{dispatcher, config.server_options()};

    mcpsse::install_stop_handlers();
    mcpsse::ShutdownWatcher watcher{server};

    try {
        server.listen();
    } catch (const mcpsse::McpTransportError& e) {
        mcpsse::logger()->critical("{}", e.what());
        return 1;
    }
    return 0;
}
