#pragma once
#include "transport.hpp"
#include "../capability.hpp"
#include "../channel.hpp"
#include "../convert_endpoint.hpp"
#include "../session.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Forward declaration to avoid including the heavy httplib header
namespace httplib {
    class Server;
}

namespace mdmcp {

/// 32 lowercase hex characters from a 128-bit random value.
std::string generate_session_token();

/// True if `token` has the shape generate_session_token() produces.
bool is_well_formed_token(const std::string& token);

/// One SSE connection: its engine plus the two channels linking the HTTP
/// threads to the engine worker.
///
///   POST /messages/ --inbound--> worker (Session::handle_inbound) --outbound--> GET /sse stream
class SseSession : public std::enable_shared_from_this<SseSession> {
public:
    SseSession(std::string token, std::shared_ptr<const CapabilityRegistry> registry,
               Session::Options opts, size_t channel_capacity);
    ~SseSession();

    SseSession(const SseSession&) = delete;
    SseSession& operator=(const SseSession&) = delete;

    /// Starts the worker. The worker holds its own reference, so the session
    /// must be owned by a shared_ptr.
    void start();

    /// Close the engine and both channels without waiting for the worker. A
    /// conversion in progress runs to completion on the detached worker and
    /// its result is discarded. Idempotent.
    void close();

    const std::string& token() const noexcept { return token_; }
    Session& engine() { return engine_; }
    const Session& engine() const { return engine_; }

    BoundedChannel<std::string>& inbound() { return inbound_; }
    BoundedChannel<std::string>& outbound() { return outbound_; }

private:
    void run();

    std::string token_;
    Session engine_;
    BoundedChannel<std::string> inbound_;
    BoundedChannel<std::string> outbound_;
    std::thread worker_;
    std::mutex close_mutex_;
    bool closed_{false};
};

/// Live SSE sessions by token.
class SessionTable {
public:
    void insert(std::shared_ptr<SseSession> session);

    /// nullptr for unknown tokens.
    std::shared_ptr<SseSession> find(const std::string& token) const;

    /// Removes and returns the session, or nullptr.
    std::shared_ptr<SseSession> remove(const std::string& token);

    /// Removes every session and closes it.
    void close_all();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<SseSession>> sessions_;
};

/// Network mode: MCP over the legacy HTTP+SSE convention plus POST /convert.
class SseTransport : public ITransport {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 3001;
        int max_connections = 64;
        size_t channel_capacity = 64;
        std::chrono::milliseconds keepalive_interval{15000};
        std::chrono::milliseconds post_timeout{5000};
        Implementation server_info{"markitdown", std::nullopt, "0.1.0"};
        std::optional<std::string> instructions;
    };

    SseTransport(std::shared_ptr<const CapabilityRegistry> registry, Options opts);
    ~SseTransport() override;

    /// Bind the listening socket. Throws McpTransportError. Called by serve()
    /// if not done before; port 0 binds an ephemeral port.
    uint16_t bind();

    /// Blocks until shutdown().
    void serve() override;
    void shutdown() override;
    bool is_running() const override;

    /// Port actually bound; 0 before bind().
    uint16_t bound_port() const { return bound_port_; }

    const SessionTable& sessions() const { return sessions_; }

private:
    void setup_routes();
    std::shared_ptr<SseSession> open_session();

    std::shared_ptr<const CapabilityRegistry> registry_;
    Options opts_;
    ConvertEndpoint convert_endpoint_;
    std::unique_ptr<httplib::Server> server_;
    SessionTable sessions_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<uint16_t> bound_port_{0};
};

} // namespace mdmcp
