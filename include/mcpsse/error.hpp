#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace mcpsse {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Inbound bytes are not well-formed JSON.
class McpParseError : public McpError {
public:
    using McpError::McpError;
};

/// A failure that maps onto a specific JSON-RPC error code.
class McpProtocolError : public McpError {
public:
    int code;
    std::optional<nlohmann::json> data;
    McpProtocolError(int code, const std::string& msg,
                     std::optional<nlohmann::json> data = std::nullopt)
        : McpError(msg), code(code), data(std::move(data)) {}
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

class McpConfigError : public McpError {
public:
    using McpError::McpError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InternalError    = -32603;
} // namespace error

} // namespace mcpsse
