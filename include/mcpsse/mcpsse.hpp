#pragma once

/// Umbrella header for the mcpsse MCP-over-SSE server library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "tool_registry.hpp"
#include "catalog.hpp"
#include "data_provider.hpp"
#include "schema.hpp"
#include "router.hpp"
#include "dispatcher.hpp"
#include "timer_queue.hpp"
#include "session.hpp"
#include "config.hpp"
#include "transport/sse_http_server.hpp"
#include "transport/shutdown_signal.hpp"
