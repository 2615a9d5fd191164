#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace rapidmcp {

class Codec {
public:
    /// Parse one framed unit into a message.
    /// Throws McpParseError when the unit is not a single valid JSON value, and
    /// McpProtocolError(InvalidRequest) when it is JSON but not a JSON-RPC 2.0 envelope.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Best-effort extraction of the envelope id from a unit that failed to parse.
    /// Reads top-level members up to the first syntax error, so truncated
    /// lines still yield the id when it precedes the damage.
    [[nodiscard]] static std::optional<RequestId> recover_id(std::string_view raw);

    /// Serialize a message to a single-line JSON string.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace rapidmcp
