#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace mcpsse {

class Codec {
public:
    /// Parse raw JSON bytes into a message.
    /// Throws McpParseError when the bytes are not well-formed JSON and
    /// McpProtocolError(InvalidRequest) when the JSON is not an envelope.
    /// A wrong or missing "jsonrpc" member is not rejected here.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Serialize a message to JSON string.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

    /// Wrap a serialized message in an event-stream data frame.
    [[nodiscard]] static std::string sse_frame(const JsonRpcMessage& msg);

    [[nodiscard]] static JsonRpcResponse make_result(RequestId id, nlohmann::json result);
    [[nodiscard]] static JsonRpcResponse make_error(RequestId id, JsonRpcError error);
    [[nodiscard]] static JsonRpcNotification make_notification(
        std::string method, nlohmann::json params = nlohmann::json::object());

    static constexpr std::string_view HEARTBEAT_FRAME = ": heartbeat\n\n";

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace mcpsse
