#include "mdmcp/converter.hpp"
#include "mdmcp/error.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mdmcp {

namespace {

constexpr int EXEC_FAILED_STATUS = 127;
constexpr size_t MAX_STDERR_IN_MESSAGE = 2000;

std::string trim(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // anonymous namespace

std::string uri_scheme(const std::string& uri) {
    auto colon = uri.find(':');
    if (colon == std::string::npos || colon == 0) return {};
    if (!std::isalpha(static_cast<unsigned char>(uri[0]))) return {};
    std::string scheme = uri.substr(0, colon);
    for (char c : scheme) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '+' && c != '-' && c != '.') return {};
    }
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return scheme;
}

bool is_supported_uri(const std::string& uri) {
    const std::string scheme = uri_scheme(uri);
    return scheme == "http" || scheme == "https" || scheme == "file" || scheme == "data";
}

CommandConverter::CommandConverter(Options opts)
    : opts_(std::move(opts)) {
}

std::string CommandConverter::convert(const std::string& uri) {
    if (uri_scheme(uri).empty()) {
        throw ConversionError("Malformed URI: '" + uri + "'");
    }
    if (!is_supported_uri(uri)) {
        throw ConversionError("Unsupported URI scheme '" + uri_scheme(uri)
                              + "'; expected http:, https:, file: or data:");
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        throw ConversionError(std::string("Failed to create pipe: ") + std::strerror(errno));
    }
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        int saved = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        throw ConversionError(std::string("Failed to create pipe: ") + std::strerror(saved));
    }

    // Build argv before fork; only async-signal-safe calls in the child.
    std::vector<std::string> argv_storage;
    argv_storage.push_back(opts_.command);
    argv_storage.insert(argv_storage.end(), opts_.args.begin(), opts_.args.end());
    argv_storage.push_back(uri);
    std::vector<char*> argv_vec;
    for (auto& a : argv_storage) argv_vec.push_back(a.data());
    argv_vec.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        throw ConversionError(std::string("Failed to fork converter: ") + std::strerror(saved));
    }
    if (pid == 0) {
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[1]);
        ::close(err_pipe[1]);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        // The server blocks its shutdown signals; the converter must not inherit that.
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(argv_vec[0], argv_vec.data());
        _exit(EXEC_FAILED_STATUS);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    spdlog::debug("Started converter '{}' (pid {}) for {}", opts_.command, pid, uri);

    std::string out;
    std::string err;
    const auto deadline = std::chrono::steady_clock::now() + opts_.timeout;
    bool timed_out = false;
    char chunk[4096];

    while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }

        struct pollfd fds[2];
        fds[0].fd = out_pipe[0];
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = err_pipe[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) continue;

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = ::read(fds[i].fd, chunk, sizeof(chunk));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                close_fd(i == 0 ? out_pipe[0] : err_pipe[0]);
                continue;
            }
            (i == 0 ? out : err).append(chunk, static_cast<size_t>(n));
        }
    }

    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    if (timed_out) {
        ::kill(pid, SIGKILL);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw ConversionError(std::string("Failed to wait for converter: ")
                                  + std::strerror(errno));
        }
    }

    if (timed_out) {
        throw ConversionError("Conversion of " + uri + " timed out after "
                              + std::to_string(opts_.timeout.count()) + " ms");
    }

    if (WIFSIGNALED(status)) {
        throw ConversionError("Converter '" + opts_.command + "' killed by signal "
                              + std::to_string(WTERMSIG(status)));
    }
    int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (code == EXEC_FAILED_STATUS && out.empty()) {
        throw ConversionError("Failed to run converter '" + opts_.command + "'");
    }
    if (code != 0) {
        std::string detail = trim(err);
        if (detail.size() > MAX_STDERR_IN_MESSAGE) {
            size_t cut = detail.size() - MAX_STDERR_IN_MESSAGE;
            // Never start inside a multibyte sequence.
            while (cut < detail.size()
                   && (static_cast<unsigned char>(detail[cut]) & 0xC0) == 0x80) {
                ++cut;
            }
            detail = detail.substr(cut);
        }
        std::string msg = "Converter '" + opts_.command + "' failed for " + uri
                          + " (exit status " + std::to_string(code) + ")";
        if (!detail.empty()) msg += ": " + detail;
        throw ConversionError(msg);
    }
    return out;
}

Capability make_convert_capability(std::shared_ptr<Converter> converter) {
    Capability cap;
    cap.id = CONVERT_CAPABILITY_ID;
    cap.description = "Convert a resource described by an http:, https:, file: or data: URI to markdown";
    cap.input_schema["uri"] = FieldSpec{FieldType::String, true, std::nullopt};
    cap.handler = [converter = std::move(converter)](const nlohmann::json& args) {
        return converter->convert(args.at("uri").get<std::string>());
    };
    return cap;
}

} // namespace mdmcp
