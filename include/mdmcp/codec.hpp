#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string_view>
#include <vector>

namespace mdmcp {

/// One decoded frame: a single message, or the members of a JSON-RPC batch.
struct DecodedFrame {
    std::vector<JsonRpcMessage> messages;
    bool batch = false;
};

class Codec {
public:
    /// Decode one frame (JSON object or array of objects).
    /// Throws McpParseError with code ParseError on invalid JSON and
    /// InvalidRequest on JSON that is not a JSON-RPC message.
    [[nodiscard]] static DecodedFrame decode(std::string_view raw);

    /// Decode a frame that must hold exactly one message.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Parse raw bytes into a JSON document without interpreting it.
    [[nodiscard]] static nlohmann::json parse_json(std::string_view raw);

    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace mdmcp
