#include "mdmcp/transport/sse_transport.hpp"
#include "mdmcp/codec.hpp"
#include "mdmcp/error.hpp"
#include <spdlog/spdlog.h>

#include <httplib.h>

#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace mdmcp {

namespace {

const char* const MESSAGES_PATH = "/messages/";

std::string sse_event(const char* event, const std::string& data) {
    std::string out;
    out.reserve(data.size() + 32);
    out += "event: ";
    out += event;
    out += "\ndata: ";
    out += data;
    out += "\n\n";
    return out;
}

void plain_reply(httplib::Response& res, int status, const char* text) {
    res.status = status;
    res.set_content(text, "text/plain");
}

} // anonymous namespace

std::string generate_session_token() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t a = dis(gen), b = dis(gen);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(16) << a << std::setw(16) << b;
    return oss.str();
}

bool is_well_formed_token(const std::string& token) {
    if (token.size() != 32) return false;
    for (char c : token) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// ---------- SseSession ----------

SseSession::SseSession(std::string token, std::shared_ptr<const CapabilityRegistry> registry,
                       Session::Options opts, size_t channel_capacity)
    : token_(std::move(token))
    , engine_(std::move(registry), std::move(opts))
    , inbound_(channel_capacity)
    , outbound_(channel_capacity) {
}

SseSession::~SseSession() {
    close();
}

void SseSession::start() {
    auto self = shared_from_this();
    worker_ = std::thread([self]() { self->run(); });
}

void SseSession::run() {
    while (auto frame = inbound_.pop()) {
        std::vector<std::string> replies;
        try {
            for (const auto& msg : engine_.handle_inbound(*frame)) {
                replies.push_back(Codec::serialize(msg));
            }
        } catch (const std::exception& e) {
            spdlog::error("[{}] Frame processing failed: {}", token_, e.what());
            continue;
        }
        for (auto& reply : replies) {
            // Stream gone: nobody is left to read the result.
            if (!outbound_.push(std::move(reply))) return;
        }
        if (engine_.is_closed()) {
            // Lets the stream flush what is queued and then end.
            outbound_.close();
            return;
        }
    }
}

void SseSession::close() {
    {
        std::lock_guard<std::mutex> lock(close_mutex_);
        if (closed_) return;
        closed_ = true;
    }
    engine_.close();
    inbound_.close();
    outbound_.close();
    if (worker_.joinable()) worker_.detach();
}

// ---------- SessionTable ----------

void SessionTable::insert(std::shared_ptr<SseSession> session) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[session->token()] = std::move(session);
}

std::shared_ptr<SseSession> SessionTable::find(const std::string& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(token);
    if (it == sessions_.end()) return nullptr;
    return it->second;
}

std::shared_ptr<SseSession> SessionTable::remove(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(token);
    if (it == sessions_.end()) return nullptr;
    auto session = std::move(it->second);
    sessions_.erase(it);
    return session;
}

void SessionTable::close_all() {
    std::map<std::string, std::shared_ptr<SseSession>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(sessions_);
    }
    for (auto& [token, session] : drained) {
        session->close();
    }
}

size_t SessionTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

// ---------- SseTransport ----------

SseTransport::SseTransport(std::shared_ptr<const CapabilityRegistry> registry, Options opts)
    : registry_(std::move(registry))
    , opts_(std::move(opts))
    , convert_endpoint_(registry_)
    , server_(std::make_unique<httplib::Server>()) {
    int workers = opts_.max_connections > 0 ? opts_.max_connections : 1;
    server_->new_task_queue = [workers] {
        return new httplib::ThreadPool(static_cast<size_t>(workers));
    };
    setup_routes();
}

SseTransport::~SseTransport() {
    shutdown();
}

std::shared_ptr<SseSession> SseTransport::open_session() {
    std::string token = generate_session_token();

    Session::Options so;
    so.id = token;
    so.transport = TransportKind::Sse;
    so.server_info = opts_.server_info;
    so.instructions = opts_.instructions;

    auto session = std::make_shared<SseSession>(token, registry_, std::move(so),
                                                opts_.channel_capacity);
    session->start();
    sessions_.insert(session);
    spdlog::info("[{}] SSE session opened", token);

    // Raced with shutdown(): close_all() may already have run.
    if (shutdown_requested_) {
        sessions_.remove(token);
        session->close();
    }
    return session;
}

void SseTransport::setup_routes() {
    // GET /sse: open a session and stream its outbound frames.
    server_->Get("/sse", [this](const httplib::Request&, httplib::Response& res) {
        auto session = open_session();
        const auto keepalive = opts_.keepalive_interval;

        res.set_header("Cache-Control", "no-cache");
        res.set_chunked_content_provider("text/event-stream",
            [session, keepalive](size_t offset, httplib::DataSink& sink) -> bool {
                if (offset == 0) {
                    std::string endpoint = sse_event("endpoint",
                        std::string(MESSAGES_PATH) + "?session_id=" + session->token());
                    return sink.write(endpoint.data(), endpoint.size());
                }

                auto frame = session->outbound().pop_for(keepalive);
                if (frame) {
                    std::string event = sse_event("message", *frame);
                    spdlog::debug("[{}] -> {} bytes", session->token(), frame->size());
                    return sink.write(event.data(), event.size());
                }
                if (session->outbound().closed()) {
                    sink.done();
                    return true;
                }
                // Writing is the only way to notice a vanished client.
                static const std::string ping = ": ping\n\n";
                return sink.write(ping.data(), ping.size());
            },
            [this, session](bool) {
                sessions_.remove(session->token());
                session->close();
            });
    });

    // POST /messages/?session_id=<token>: hand one frame to the session.
    server_->Post(R"(/messages/?)", [this](const httplib::Request& req, httplib::Response& res) {
        if (!req.has_param("session_id")) {
            plain_reply(res, 400, "session_id is required");
            return;
        }
        std::string token = req.get_param_value("session_id");
        if (!is_well_formed_token(token)) {
            plain_reply(res, 400, "Invalid session ID");
            return;
        }

        auto session = sessions_.find(token);
        if (!session || session->engine().is_closed()) {
            spdlog::warn("{}", UnknownSessionTokenError(token).what());
            plain_reply(res, 404, "Could not find session");
            return;
        }

        bool undecodable = false;
        try {
            (void)Codec::decode(req.body);
        } catch (const McpParseError& e) {
            spdlog::warn("[{}] Could not parse message: {}", token, e.what());
            undecodable = true;
        }

        // The engine answers undecodable frames on the stream too.
        switch (session->inbound().push_for(req.body, opts_.post_timeout)) {
            case BoundedChannel<std::string>::PushResult::Closed:
                plain_reply(res, 404, "Could not find session");
                return;
            case BoundedChannel<std::string>::PushResult::Full:
                spdlog::warn("[{}] Inbound channel full, rejecting message", token);
                plain_reply(res, 503, "Session is busy");
                return;
            case BoundedChannel<std::string>::PushResult::Ok:
                break;
        }

        if (undecodable) {
            plain_reply(res, 400, "Could not parse message");
        } else {
            plain_reply(res, 202, "Accepted");
        }
    });

    server_->Post("/convert", [this](const httplib::Request& req, httplib::Response& res) {
        auto reply = convert_endpoint_.handle(req.body);
        res.status = reply.status;
        res.set_content(reply.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                        "application/json");
    });
}

uint16_t SseTransport::bind() {
    if (bound_port_ != 0) return bound_port_;

    if (opts_.port == 0) {
        int port = server_->bind_to_any_port(opts_.host);
        if (port < 0) {
            throw McpTransportError("Failed to bind an ephemeral port on " + opts_.host);
        }
        bound_port_ = static_cast<uint16_t>(port);
    } else {
        if (!server_->bind_to_port(opts_.host, opts_.port)) {
            throw McpTransportError("Failed to bind " + opts_.host + ":"
                                    + std::to_string(opts_.port));
        }
        bound_port_ = opts_.port;
    }
    spdlog::info("Listening on http://{}:{} (SSE endpoint /sse)", opts_.host, bound_port_.load());
    return bound_port_;
}

void SseTransport::serve() {
    bind();
    if (shutdown_requested_) return;
    if (running_.exchange(true)) {
        throw McpTransportError("SseTransport is already serving");
    }
    if (shutdown_requested_) {
        running_ = false;
        return;
    }

    bool ok = server_->listen_after_bind();
    running_ = false;
    sessions_.close_all();
    if (!ok && !shutdown_requested_) {
        throw McpTransportError("HTTP server on " + opts_.host + ":"
                                + std::to_string(bound_port_.load()) + " stopped unexpectedly");
    }
    spdlog::info("SSE transport stopped");
}

void SseTransport::shutdown() {
    shutdown_requested_ = true;
    // Ends every open stream so the server's worker threads can be joined.
    sessions_.close_all();
    if (running_) {
        server_->wait_until_ready();
        server_->stop();
    }
}

bool SseTransport::is_running() const {
    return running_;
}

} // namespace mdmcp
