#include <gtest/gtest.h>
#include "mdmcp/transport/sse_transport.hpp"
#include "mdmcp/converter.hpp"

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>

using namespace mdmcp;
using namespace std::chrono_literals;

namespace {

class StubConverter : public Converter {
public:
    std::string convert(const std::string& uri) override {
        ++calls;
        if (uri.find("slow") != std::string::npos) {
            std::this_thread::sleep_for(300ms);
        }
        if (uri.find("stuck") != std::string::npos) {
            std::this_thread::sleep_for(3s);
        }
        if (uri.find("latin1") != std::string::npos) {
            return "caf\xe9 \xff";
        }
        if (uri.find("broken") != std::string::npos) {
            throw ConversionError("Could not convert " + uri + ": unsupported format");
        }
        if (uri == "file:///a.txt") return "# Title";
        return "markdown for " + uri;
    }
    std::atomic<int> calls{0};
};

struct SseEvent {
    std::string event;
    std::string data;
};

/// Reads GET /sse on a background thread and queues the parsed events.
class SseStream {
public:
    SseStream(const std::string& host, uint16_t port) : client_(host, port) {
        client_.set_read_timeout(10, 0);
        reader_ = std::thread([this] {
            // Returns once the server ends the stream or we stop reading.
            client_.Get("/sse", [this](const char* data, size_t len) {
                feed(std::string(data, len));
                return !stop_.load();
            });
            std::lock_guard<std::mutex> lock(mutex_);
            ended_ = true;
            cv_.notify_all();
        });
    }

    ~SseStream() { close(); }

    /// Stop reading; the server notices on its next write.
    void close() {
        stop_ = true;
        if (reader_.joinable()) reader_.join();
    }

    std::optional<SseEvent> next(std::chrono::milliseconds timeout = 5000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !events_.empty() || ended_; });
        if (events_.empty()) return std::nullopt;
        SseEvent ev = std::move(events_.front());
        events_.pop_front();
        return ev;
    }

    /// The session token from the endpoint event.
    std::string token() {
        auto ev = next();
        if (!ev || ev->event != "endpoint") return {};
        const std::string prefix = "/messages/?session_id=";
        if (ev->data.rfind(prefix, 0) != 0) return {};
        return ev->data.substr(prefix.size());
    }

    nlohmann::json next_message(std::chrono::milliseconds timeout = 5000ms) {
        auto ev = next(timeout);
        if (!ev || ev->event != "message") return nullptr;
        return nlohmann::json::parse(ev->data);
    }

    bool ended() {
        std::lock_guard<std::mutex> lock(mutex_);
        return ended_;
    }

    bool wait_ended(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return ended_; });
    }

private:
    void feed(const std::string& chunk) {
        std::lock_guard<std::mutex> lock(mutex_);
        buffer_ += chunk;
        size_t end;
        while ((end = buffer_.find("\n\n")) != std::string::npos) {
            std::string block = buffer_.substr(0, end);
            buffer_.erase(0, end + 2);

            SseEvent ev;
            size_t pos = 0;
            while (pos <= block.size()) {
                size_t nl = block.find('\n', pos);
                std::string line = block.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos);
                if (line.rfind("event: ", 0) == 0) ev.event = line.substr(7);
                else if (line.rfind("data: ", 0) == 0) ev.data = line.substr(6);
                if (nl == std::string::npos) break;
                pos = nl + 1;
            }
            // Comment-only blocks are keep-alives.
            if (!ev.event.empty()) events_.push_back(std::move(ev));
        }
        cv_.notify_all();
    }

    httplib::Client client_;
    std::thread reader_;
    std::atomic<bool> stop_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::string buffer_;
    std::deque<SseEvent> events_;
    bool ended_{false};
};

const char* const INIT =
    R"({"jsonrpc":"2.0","id":0,"method":"initialize","params":{"protocolVersion":"2025-06-18","capabilities":{},"clientInfo":{"name":"sse-test","version":"1.0"}}})";
const char* const INITIALIZED = R"({"jsonrpc":"2.0","method":"notifications/initialized"})";

std::string call(int id, const std::string& uri) {
    return nlohmann::json{
        {"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/call"},
        {"params", {{"name", "convert_to_markdown"}, {"arguments", {{"uri", uri}}}}}
    }.dump();
}

class SseE2ETest : public ::testing::Test {
protected:
    void SetUp() override {
        converter_ = std::make_shared<StubConverter>();
        auto registry = std::make_shared<CapabilityRegistry>();
        registry->register_capability(make_convert_capability(converter_));

        SseTransport::Options opts;
        opts.port = 0;
        opts.max_connections = 16;
        opts.keepalive_interval = 100ms;
        opts.post_timeout = 500ms;
        transport_ = std::make_unique<SseTransport>(registry, opts);
        port_ = transport_->bind();
        server_thread_ = std::thread([this] { transport_->serve(); });
        for (int i = 0; i < 200 && !transport_->is_running(); ++i) {
            std::this_thread::sleep_for(5ms);
        }
    }

    void TearDown() override {
        transport_->shutdown();
        if (server_thread_.joinable()) server_thread_.join();
    }

    std::unique_ptr<SseStream> open_stream() {
        return std::make_unique<SseStream>("127.0.0.1", port_);
    }

    int post(const std::string& path, const std::string& body) {
        httplib::Client client("127.0.0.1", port_);
        auto res = client.Post(path, body, "application/json");
        return res ? res->status : -1;
    }

    int post_message(const std::string& token, const std::string& body) {
        return post("/messages/?session_id=" + token, body);
    }

    /// Opens a stream and completes the handshake on it.
    std::unique_ptr<SseStream> ready_stream(std::string& token) {
        auto stream = open_stream();
        token = stream->token();
        EXPECT_EQ(post_message(token, INIT), 202);
        auto init = stream->next_message();
        EXPECT_EQ(init["id"], 0);
        EXPECT_EQ(post_message(token, INITIALIZED), 202);
        return stream;
    }

    std::shared_ptr<StubConverter> converter_;
    std::unique_ptr<SseTransport> transport_;
    std::thread server_thread_;
    uint16_t port_{0};
};

} // namespace

TEST_F(SseE2ETest, BindsEphemeralPort) {
    EXPECT_NE(port_, 0);
    EXPECT_EQ(transport_->bound_port(), port_);
    EXPECT_TRUE(transport_->is_running());
}

TEST_F(SseE2ETest, EndpointEventCarriesToken) {
    auto stream = open_stream();
    auto token = stream->token();
    EXPECT_TRUE(is_well_formed_token(token)) << token;
}

TEST_F(SseE2ETest, HandshakeAndConversion) {
    std::string token;
    auto stream = ready_stream(token);

    EXPECT_EQ(post_message(token, R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})"), 202);
    auto list = stream->next_message();
    EXPECT_EQ(list["result"]["tools"][0]["name"], "convert_to_markdown");

    EXPECT_EQ(post_message(token, call(2, "file:///a.txt")), 202);
    auto result = stream->next_message();
    EXPECT_EQ(result["id"], 2);
    EXPECT_EQ(result["result"]["content"][0]["text"], "# Title");
}

TEST_F(SseE2ETest, MissingUriAnsweredWithoutConversion) {
    std::string token;
    auto stream = ready_stream(token);
    EXPECT_EQ(post_message(token,
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"convert_to_markdown","arguments":{}}})"),
        202);
    auto resp = stream->next_message();
    EXPECT_EQ(resp["id"], 3);
    EXPECT_EQ(resp["error"]["code"], -32602);
    EXPECT_EQ(converter_->calls.load(), 0);
}

TEST_F(SseE2ETest, SessionsAreIsolated) {
    std::string token_a, token_b;
    auto a = ready_stream(token_a);
    auto b = ready_stream(token_b);
    ASSERT_NE(token_a, token_b);

    EXPECT_EQ(post_message(token_a, call(1, "https://example.com/slow")), 202);
    EXPECT_EQ(post_message(token_b, call(1, "https://example.com/fast")), 202);

    // B is not held up by A's slow conversion.
    auto start = std::chrono::steady_clock::now();
    auto rb = b->next_message();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 250ms);
    EXPECT_EQ(rb["result"]["content"][0]["text"], "markdown for https://example.com/fast");

    auto ra = a->next_message();
    EXPECT_EQ(ra["result"]["content"][0]["text"], "markdown for https://example.com/slow");

    // Neither stream sees the other's result.
    EXPECT_FALSE(a->next(300ms).has_value());
    EXPECT_FALSE(b->next(300ms).has_value());
}

TEST_F(SseE2ETest, OrderWithinSessionFollowsArrival) {
    std::string token;
    auto stream = ready_stream(token);
    EXPECT_EQ(post_message(token, call(1, "https://example.com/slow")), 202);
    EXPECT_EQ(post_message(token, call(2, "file:///a.txt")), 202);
    EXPECT_EQ(stream->next_message()["id"], 1);
    EXPECT_EQ(stream->next_message()["id"], 2);
}

TEST_F(SseE2ETest, TokenErrors) {
    EXPECT_EQ(post("/messages/", INIT), 400);
    EXPECT_EQ(post("/messages/?session_id=zzz", INIT), 400);
    EXPECT_EQ(post_message(generate_session_token(), INIT), 404);
}

TEST_F(SseE2ETest, ClosedTokenIs404) {
    auto stream = open_stream();
    auto token = stream->token();
    ASSERT_TRUE(is_well_formed_token(token));
    stream->close();

    for (int i = 0; i < 200 && transport_->sessions().size() > 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(transport_->sessions().size(), 0u);
    EXPECT_EQ(post_message(token, INIT), 404);
}

TEST_F(SseE2ETest, UnknownTokenPostDoesNotDisturbOthers) {
    std::string token;
    auto stream = ready_stream(token);
    EXPECT_EQ(post_message(generate_session_token(), call(9, "file:///a.txt")), 404);
    EXPECT_FALSE(stream->next(300ms).has_value());
}

TEST_F(SseE2ETest, UndecodableBodyIs400WithErrorOnStream) {
    std::string token;
    auto stream = ready_stream(token);
    EXPECT_EQ(post_message(token, "{not json"), 400);
    auto resp = stream->next_message();
    EXPECT_TRUE(resp["id"].is_null());
    EXPECT_EQ(resp["error"]["code"], -32700);
}

TEST_F(SseE2ETest, ReconnectCreatesNewSession) {
    auto first = open_stream();
    auto t1 = first->token();
    first->close();
    auto second = open_stream();
    auto t2 = second->token();
    EXPECT_TRUE(is_well_formed_token(t2));
    EXPECT_NE(t1, t2);
}

TEST_F(SseE2ETest, SequenceViolationEndsStream) {
    auto stream = open_stream();
    auto token = stream->token();
    EXPECT_EQ(post_message(token, call(1, "file:///a.txt")), 202);
    auto resp = stream->next_message();
    EXPECT_EQ(resp["id"], 1);
    EXPECT_EQ(resp["error"]["code"], -32600);
    EXPECT_TRUE(stream->wait_ended(3000ms));
    EXPECT_EQ(converter_->calls.load(), 0);
}

TEST_F(SseE2ETest, ConvertEndpoint) {
    httplib::Client client("127.0.0.1", port_);

    auto ok = client.Post("/convert", R"({"uri":"file:///a.txt"})", "application/json");
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok->status, 200);
    EXPECT_EQ(nlohmann::json::parse(ok->body), (nlohmann::json{{"markdown", "# Title"}}));

    auto missing = client.Post("/convert", "{}", "application/json");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 400);
    EXPECT_EQ(nlohmann::json::parse(missing->body)["error"], "Missing required parameter: uri");

    auto broken = client.Post("/convert", R"({"uri":"file:///broken.pdf"})", "application/json");
    ASSERT_TRUE(broken);
    EXPECT_EQ(broken->status, 500);
    EXPECT_NE(nlohmann::json::parse(broken->body)["error"].get<std::string>().find("unsupported format"),
              std::string::npos);
}

TEST_F(SseE2ETest, NonUtf8ConversionKeepsSessionAlive) {
    std::string token;
    auto stream = ready_stream(token);
    EXPECT_EQ(post_message(token, call(1, "file:///latin1.txt")), 202);
    auto result = stream->next_message();
    EXPECT_EQ(result["id"], 1);
    EXPECT_EQ(result["result"]["content"][0]["text"], "caf\xef\xbf\xbd \xef\xbf\xbd");

    EXPECT_EQ(post_message(token, call(2, "file:///a.txt")), 202);
    EXPECT_EQ(stream->next_message()["id"], 2);

    httplib::Client client("127.0.0.1", port_);
    auto res = client.Post("/convert", R"({"uri":"file:///latin1.txt"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(nlohmann::json::parse(res->body)["markdown"], "caf\xef\xbf\xbd \xef\xbf\xbd");
}

TEST_F(SseE2ETest, DisconnectDoesNotWaitForConversion) {
    std::string token;
    auto stream = ready_stream(token);
    EXPECT_EQ(post_message(token, call(1, "file:///stuck.txt")), 202);
    for (int i = 0; i < 200 && converter_->calls.load() == 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(converter_->calls.load(), 1);

    stream->close();
    for (int i = 0; i < 200 && transport_->sessions().size() > 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(transport_->sessions().size(), 0u);

    // Stopping joins the server threads, including the one that released
    // the stream; it must not be parked on the conversion.
    auto start = std::chrono::steady_clock::now();
    transport_->shutdown();
    server_thread_.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1500ms);
}

TEST_F(SseE2ETest, ShutdownDoesNotWaitForConversion) {
    std::string token;
    auto stream = ready_stream(token);
    EXPECT_EQ(post_message(token, call(1, "file:///stuck.txt")), 202);
    for (int i = 0; i < 200 && converter_->calls.load() == 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(converter_->calls.load(), 1);

    auto start = std::chrono::steady_clock::now();
    transport_->shutdown();
    server_thread_.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1500ms);
    EXPECT_TRUE(stream->wait_ended(1000ms));
}

TEST_F(SseE2ETest, ShutdownEndsOpenStreams) {
    auto stream = open_stream();
    ASSERT_TRUE(is_well_formed_token(stream->token()));
    transport_->shutdown();
    EXPECT_TRUE(stream->wait_ended(3000ms));
    server_thread_.join();
    EXPECT_FALSE(transport_->is_running());
}

TEST(SessionToken, Shape) {
    auto a = generate_session_token();
    auto b = generate_session_token();
    EXPECT_EQ(a.size(), 32u);
    EXPECT_TRUE(is_well_formed_token(a));
    EXPECT_NE(a, b);
    EXPECT_FALSE(is_well_formed_token("abc"));
    EXPECT_FALSE(is_well_formed_token(std::string(32, 'g')));
}
