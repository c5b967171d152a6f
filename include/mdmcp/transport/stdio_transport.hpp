#pragma once
#include "transport.hpp"
#include "../capability.hpp"
#include "../session.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace mdmcp {

/// Serves exactly one session over newline-delimited JSON on stdin/stdout.
/// A reader loop feeds each line to the session engine; a writer thread
/// emits every produced frame as soon as it is queued.
class StdioTransport : public ITransport {
public:
    struct Options {
        Implementation server_info{"markitdown", std::nullopt, "0.1.0"};
        std::optional<std::string> instructions;
    };

    /// Use the process's stdin/stdout.
    StdioTransport(std::shared_ptr<const CapabilityRegistry> registry, Options opts);

    /// Use the given descriptors, which the transport then owns (for testing).
    StdioTransport(std::shared_ptr<const CapabilityRegistry> registry, Options opts,
                   int read_fd, int write_fd);

    ~StdioTransport() override;

    /// Returns once stdin reaches end-of-stream (or shutdown() was called)
    /// and every queued frame has been written.
    void serve() override;
    void shutdown() override;
    bool is_running() const override;

    const Session& session() const { return session_; }

private:
    void read_loop();
    void write_loop();
    void handle_line(std::string_view line);
    void enqueue(std::string frame);

    Session session_;

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::thread writer_thread_;

    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;
    bool writer_done_{false};

    int wakeup_pipe_[2]{-1, -1};  // interrupts poll() in read_loop
};

} // namespace mdmcp
