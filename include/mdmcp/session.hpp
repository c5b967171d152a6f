#pragma once
#include "capability.hpp"
#include "json_rpc.hpp"
#include "router.hpp"
#include "types.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mdmcp {

enum class SessionState {
    Uninitialized,
    Ready,
    Closed
};

enum class TransportKind {
    Stdio,
    Sse
};

const char* session_state_name(SessionState state);
const char* transport_kind_name(TransportKind kind);

/// Protocol engine for one logical MCP session. Independent of how frames
/// reach it: the owning transport hands complete frames to handle_inbound()
/// and writes back whatever it returns, in order.
///
/// Uninitialized --initialize--> Ready --(requests)--> Ready --close()--> Closed.
/// Any other frame on an Uninitialized session closes it.
class Session {
public:
    struct Options {
        std::string id;
        TransportKind transport = TransportKind::Stdio;
        Implementation server_info{"markitdown", std::nullopt, "0.1.0"};
        std::optional<std::string> instructions;
    };

    Session(std::shared_ptr<const CapabilityRegistry> registry, Options opts);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Process one frame (a message or a batch). Returns the outbound
    /// messages in the order their requests arrived. Decode failures yield a
    /// single uncorrelated error response. Frames on a closed session are
    /// ignored.
    std::vector<JsonRpcMessage> handle_inbound(std::string_view frame);

    /// Resolve, validate and invoke one request. Never throws; every failure
    /// is reported in the response's error member.
    JsonRpcResponse dispatch(const JsonRpcRequest& req);

    /// Transport closed. Idempotent.
    void close();

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] bool is_closed() const { return state() == SessionState::Closed; }

    [[nodiscard]] const std::string& id() const noexcept { return opts_.id; }
    [[nodiscard]] TransportKind transport() const noexcept { return opts_.transport; }

    /// Negotiated during initialize; empty before.
    [[nodiscard]] std::string protocol_version() const;
    [[nodiscard]] std::optional<Implementation> client_info() const;
    [[nodiscard]] bool client_initialized() const;

private:
    void setup_handlers();
    void process(const JsonRpcMessage& msg, std::vector<JsonRpcMessage>& out,
                 std::set<std::string>& open_ids);
    JsonRpcResponse dispatch_open(const JsonRpcRequest& req);
    void violate_sequence(const std::string& what);

    HandlerResult on_initialize(const nlohmann::json& params);
    HandlerResult on_tools_call(const nlohmann::json& params);
    nlohmann::json on_tools_list() const;

    std::shared_ptr<const CapabilityRegistry> registry_;
    Options opts_;
    Router router_;

    // Serializes handle_inbound/dispatch so responses leave in arrival order.
    std::mutex dispatch_mutex_;

    mutable std::mutex mutex_;
    SessionState state_{SessionState::Uninitialized};
    std::string protocol_version_;
    std::optional<Implementation> client_info_;
    bool client_initialized_{false};
};

} // namespace mdmcp
