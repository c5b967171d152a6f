#include "mdmcp/session.hpp"
#include "mdmcp/codec.hpp"
#include "mdmcp/error.hpp"
#include "mdmcp/version.hpp"
#include <spdlog/spdlog.h>

namespace mdmcp {

namespace {

std::string negotiate_protocol_version(const std::string& requested) {
    for (auto supported : SUPPORTED_PROTOCOL_VERSIONS) {
        if (supported == requested) return requested;
    }
    return std::string(PROTOCOL_VERSION);
}

} // anonymous namespace

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Ready:         return "ready";
        case SessionState::Closed:        return "closed";
    }
    return "unknown";
}

const char* transport_kind_name(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Sse:   return "sse";
    }
    return "unknown";
}

Session::Session(std::shared_ptr<const CapabilityRegistry> registry, Options opts)
    : registry_(std::move(registry))
    , opts_(std::move(opts)) {
    if (!registry_) {
        throw std::invalid_argument("Session requires a capability registry");
    }
    setup_handlers();
}

void Session::setup_handlers() {
    router_.on_request("initialize", [this](const nlohmann::json& params) {
        return on_initialize(params);
    });

    router_.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json::object();
    });

    router_.on_request("tools/list", [this](const nlohmann::json&) -> HandlerResult {
        return on_tools_list();
    });

    router_.on_request("tools/call", [this](const nlohmann::json& params) {
        return on_tools_call(params);
    });

    router_.on_notification("notifications/initialized", [this](const nlohmann::json&) {
        std::lock_guard<std::mutex> lock(mutex_);
        client_initialized_ = true;
    });

    // Requests run to completion; a late result is dropped only when the
    // transport closes.
    router_.on_notification("notifications/cancelled", [this](const nlohmann::json& params) {
        spdlog::debug("[{}] Cancellation of request {} not supported, ignoring",
                      opts_.id, params.value("requestId", nlohmann::json()).dump());
    });
}

std::vector<JsonRpcMessage> Session::handle_inbound(std::string_view frame) {
    std::lock_guard<std::mutex> guard(dispatch_mutex_);
    std::vector<JsonRpcMessage> out;

    if (is_closed()) {
        spdlog::debug("[{}] Ignoring frame on closed session", opts_.id);
        return out;
    }

    DecodedFrame decoded;
    try {
        decoded = Codec::decode(frame);
    } catch (const McpParseError& e) {
        spdlog::warn("[{}] Dropping undecodable frame: {}", opts_.id, e.what());
        out.push_back(make_error_response(std::nullopt, e.code, e.what()));
        return out;
    }

    // Ids of a batch stay open until the whole batch has been answered.
    std::set<std::string> open_ids;
    for (const auto& msg : decoded.messages) {
        if (is_closed()) break;
        process(msg, out, open_ids);
    }
    return out;
}

void Session::process(const JsonRpcMessage& msg, std::vector<JsonRpcMessage>& out,
                      std::set<std::string>& open_ids) {
    const bool uninitialized = state() == SessionState::Uninitialized;

    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        spdlog::debug("[{}] <- request {} '{}'", opts_.id,
                      request_id_key(req->id), req->method);
        if (uninitialized && req->method != "initialize") {
            ProtocolSequenceError err("Received request '" + req->method
                                      + "' before initialization was complete");
            violate_sequence(err.what());
            out.push_back(make_error_response(req->id, err.code, err.what()));
            return;
        }
        if (!open_ids.insert(request_id_key(req->id)).second) {
            out.push_back(make_error_response(req->id, error::InvalidRequest,
                                              "Duplicate request id"));
            return;
        }
        out.push_back(dispatch_open(*req));
    } else if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        if (uninitialized) {
            violate_sequence("Received notification '" + notif->method
                             + "' before initialization was complete");
            return;
        }
        if (!router_.dispatch(*notif)) {
            spdlog::debug("[{}] Ignoring notification '{}'", opts_.id, notif->method);
        }
    } else {
        if (uninitialized) {
            violate_sequence("Received a response before initialization was complete");
            return;
        }
        // This server never issues requests, so there is nothing to correlate.
        spdlog::debug("[{}] Ignoring unsolicited response", opts_.id);
    }
}

JsonRpcResponse Session::dispatch(const JsonRpcRequest& req) {
    std::lock_guard<std::mutex> guard(dispatch_mutex_);

    switch (state()) {
        case SessionState::Closed:
            return make_error_response(req.id, error::InvalidRequest, "Session is closed");
        case SessionState::Uninitialized:
            if (req.method != "initialize") {
                ProtocolSequenceError err("Received request '" + req.method
                                          + "' before initialization was complete");
                violate_sequence(err.what());
                return make_error_response(req.id, err.code, err.what());
            }
            break;
        case SessionState::Ready:
            break;
    }
    return dispatch_open(req);
}

JsonRpcResponse Session::dispatch_open(const JsonRpcRequest& req) {
    try {
        return router_.dispatch(req);
    } catch (const std::exception& e) {
        spdlog::error("[{}] Dispatch of '{}' failed: {}", opts_.id, req.method, e.what());
        return make_error_response(req.id, error::InternalError, e.what());
    }
}

void Session::violate_sequence(const std::string& what) {
    spdlog::warn("[{}] Protocol sequence violation, closing session: {}", opts_.id, what);
    close();
}

void Session::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::Closed) return;
    state_ = SessionState::Closed;
    spdlog::info("[{}] {} session closed", opts_.id, transport_kind_name(opts_.transport));
}

HandlerResult Session::on_initialize(const nlohmann::json& params) {
    if (state() == SessionState::Ready) {
        return JsonRpcError{error::InvalidRequest, "Session already initialized", std::nullopt};
    }

    auto init = params.get<InitializeParams>();
    std::string negotiated = negotiate_protocol_version(init.protocol_version);

    InitializeResult result;
    result.protocol_version = negotiated;
    if (registry_->size() > 0) {
        result.capabilities.tools = nlohmann::json{{"listChanged", false}};
    }
    result.server_info = opts_.server_info;
    result.instructions = opts_.instructions;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        protocol_version_ = negotiated;
        client_info_ = init.client_info;
        state_ = SessionState::Ready;
    }
    spdlog::info("[{}] Session initialized (protocol {}, client {})", opts_.id, negotiated,
                 init.client_info ? init.client_info->name : std::string("unknown"));

    nlohmann::json j;
    to_json(j, result);
    return j;
}

nlohmann::json Session::on_tools_list() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const Capability* cap : registry_->list()) {
        tools.push_back(nlohmann::json(cap->tool_definition()));
    }
    return nlohmann::json{{"tools", std::move(tools)}};
}

HandlerResult Session::on_tools_call(const nlohmann::json& params) {
    auto name_it = params.find("name");
    if (!params.is_object() || name_it == params.end() || !name_it->is_string()) {
        throw ValidationError("tools/call requires a string 'name'");
    }
    const std::string name = name_it->get<std::string>();

    nlohmann::json arguments = nlohmann::json::object();
    auto args_it = params.find("arguments");
    if (args_it != params.end() && !args_it->is_null()) {
        arguments = *args_it;
    }

    const Capability& capability = registry_->resolve(name);

    std::string text;
    try {
        text = registry_->invoke(capability, arguments);
    } catch (const ConversionError& e) {
        spdlog::error("[{}] {} failed: {}", opts_.id, name, e.what());
        throw;
    }

    CallToolResult result;
    result.content.push_back(TextContent{std::move(text)});
    nlohmann::json j;
    to_json(j, result);
    return j;
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string Session::protocol_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return protocol_version_;
}

std::optional<Implementation> Session::client_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_info_;
}

bool Session::client_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_initialized_;
}

} // namespace mdmcp
