#include "mdmcp/transport/stdio_transport.hpp"
#include "mdmcp/codec.hpp"
#include "mdmcp/error.hpp"
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <vector>

namespace mdmcp {

namespace {

Session::Options stdio_session_options(StdioTransport::Options opts) {
    Session::Options s;
    s.id = "stdio";
    s.transport = TransportKind::Stdio;
    s.server_info = std::move(opts.server_info);
    s.instructions = std::move(opts.instructions);
    return s;
}

} // anonymous namespace

StdioTransport::StdioTransport(std::shared_ptr<const CapabilityRegistry> registry, Options opts)
    : session_(std::move(registry), stdio_session_options(std::move(opts)))
    , read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
}

StdioTransport::StdioTransport(std::shared_ptr<const CapabilityRegistry> registry, Options opts,
                               int read_fd, int write_fd)
    : session_(std::move(registry), stdio_session_options(std::move(opts)))
    , read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
}

StdioTransport::~StdioTransport() {
    shutdown();
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        writer_done_ = true;
    }
    write_cv_.notify_all();
    if (writer_thread_.joinable()) writer_thread_.join();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::serve() {
    if (running_.load() || wakeup_pipe_[0] >= 0) {
        throw McpTransportError("StdioTransport can only serve once");
    }

    if (::pipe2(wakeup_pipe_, O_CLOEXEC) < 0) {
        throw McpTransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);

    // Published only once the wakeup pipe exists; shutdown() checks it.
    running_ = true;
    if (shutdown_requested_.load()) {
        running_ = false;
        session_.close();
        return;
    }

    spdlog::info("Serving MCP over stdio");
    writer_thread_ = std::thread([this]() { write_loop(); });

    read_loop();

    running_ = false;
    session_.close();

    // Let the writer drain whatever the last frames produced.
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        writer_done_ = true;
    }
    write_cv_.notify_all();
    if (writer_thread_.joinable()) writer_thread_.join();
    spdlog::info("stdio transport finished");
}

void StdioTransport::read_loop() {
    std::string buffer;
    buffer.reserve(4096);

    char chunk[4096];

    while (running_) {
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            spdlog::error("poll on stdin failed: {}", std::strerror(errno));
            break;
        }

        if (fds[1].revents & POLLIN) break;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            spdlog::error("Read from stdin failed: {}", std::strerror(errno));
            break;
        }
        if (n == 0) {
            // A final line without a trailing newline is still a frame.
            if (!buffer.empty()) handle_line(buffer);
            spdlog::debug("stdin reached end of stream");
            break;
        }

        buffer.append(chunk, static_cast<size_t>(n));

        size_t pos = 0;
        while (true) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;
            handle_line(std::string_view(buffer).substr(pos, nl - pos));
            pos = nl + 1;
        }
        if (pos > 0) {
            buffer.erase(0, pos);
        }
    }
}

void StdioTransport::handle_line(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (line.find_first_not_of(" \t") == std::string_view::npos) return;

    std::vector<std::string> replies;
    try {
        for (const auto& msg : session_.handle_inbound(line)) {
            replies.push_back(Codec::serialize(msg));
        }
    } catch (const std::exception& e) {
        spdlog::error("[stdio] Frame processing failed: {}", e.what());
        return;
    }
    for (auto& reply : replies) {
        enqueue(std::move(reply));
    }
}

void StdioTransport::enqueue(std::string frame) {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(frame));
    }
    write_cv_.notify_one();
}

void StdioTransport::write_loop() {
    bool broken = false;
    while (true) {
        std::string frame;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] {
                return !write_queue_.empty() || writer_done_;
            });
            if (write_queue_.empty()) break;
            frame = std::move(write_queue_.front());
            write_queue_.pop();
        }
        if (broken) continue;

        frame += '\n';
        const char* data = frame.data();
        size_t remaining = frame.size();
        while (remaining > 0) {
            ssize_t written = ::write(write_fd_, data, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                spdlog::error("Write to stdout failed: {}", std::strerror(errno));
                broken = true;
                break;
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
        spdlog::debug("-> {} bytes", frame.size());
    }
}

void StdioTransport::shutdown() {
    shutdown_requested_ = true;
    if (!running_.load()) return;
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
            spdlog::warn("Failed to wake stdio reader: {}", std::strerror(errno));
        }
    }
}

bool StdioTransport::is_running() const {
    return running_;
}

} // namespace mdmcp
