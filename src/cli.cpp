#include "mdmcp/cli.hpp"
#include "mdmcp/env.hpp"
#include "mdmcp/error.hpp"
#include "mdmcp/logging.hpp"

#include <cerrno>
#include <cstdlib>
#include <optional>
#include <sstream>

namespace mdmcp {

namespace {

constexpr long MAX_CONVERTER_TIMEOUT_SECONDS = 86400;

long parse_number(const std::string& flag, const std::string& value) {
    if (value.empty()) {
        throw UsageError(flag + " expects a number");
    }
    errno = 0;
    char* end = nullptr;
    long n = std::strtol(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0') {
        throw UsageError(flag + " expects a number, got '" + value + "'");
    }
    return n;
}

} // anonymous namespace

std::vector<std::string> split_command(const std::string& command) {
    std::vector<std::string> parts;
    std::istringstream in(command);
    std::string part;
    while (in >> part) parts.push_back(part);
    return parts;
}

CliOptions parse_cli(int argc, const char* const* argv) {
    CliOptions opts;
    bool host_given = false;
    bool port_given = false;
    std::optional<std::string> log_level;
    std::optional<std::string> converter;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::optional<std::string> inline_value;
        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg.erase(eq);
            }
        }

        auto value = [&]() -> std::string {
            if (inline_value) return *inline_value;
            if (i + 1 >= argc) {
                throw UsageError(arg + " requires a value");
            }
            return argv[++i];
        };
        auto no_value = [&]() {
            if (inline_value) {
                throw UsageError(arg + " does not take a value");
            }
        };

        if (arg == "--sse") {
            no_value();
            opts.mode = TransportMode::Sse;
        } else if (arg == "--host") {
            opts.host = value();
            if (opts.host.empty()) throw UsageError("--host must not be empty");
            host_given = true;
        } else if (arg == "--port") {
            long port = parse_number(arg, value());
            if (port < 1 || port > 65535) {
                throw UsageError("--port must be between 1 and 65535");
            }
            opts.port = static_cast<uint16_t>(port);
            port_given = true;
        } else if (arg == "--log-level") {
            log_level = value();
        } else if (arg == "--converter") {
            converter = value();
        } else if (arg == "--converter-timeout") {
            long seconds = parse_number(arg, value());
            if (seconds <= 0 || seconds > MAX_CONVERTER_TIMEOUT_SECONDS) {
                throw UsageError("--converter-timeout must be between 1 and "
                                 + std::to_string(MAX_CONVERTER_TIMEOUT_SECONDS) + " seconds");
            }
            opts.converter_timeout = std::chrono::seconds(seconds);
        } else if (arg == "--help" || arg == "-h") {
            no_value();
            opts.help = true;
        } else if (arg == "--version") {
            no_value();
            opts.version = true;
        } else {
            throw UsageError("Unknown argument: " + arg);
        }
    }

    if (opts.help || opts.version) return opts;

    if (opts.mode == TransportMode::Stdio && (host_given || port_given)) {
        throw UsageError("Host and port arguments are only valid when using SSE transport.");
    }

    opts.log_level = log_level ? *log_level : get_env_or(ENV_LOG_LEVEL, "info");
    // Validates; the level itself is applied by init_logging().
    (void)parse_log_level(opts.log_level);

    std::string command = converter ? *converter : get_env_or(ENV_CONVERTER, "markitdown");
    opts.converter_command = split_command(command);
    if (opts.converter_command.empty()) {
        throw UsageError("--converter must name a program");
    }
    return opts;
}

std::string usage_text(const std::string& program) {
    return "Usage: " + program + " [options]\n"
        "\n"
        "Serve markdown conversion over the Model Context Protocol.\n"
        "\n"
        "Options:\n"
        "  --sse                      Serve MCP over HTTP+SSE instead of stdio\n"
        "  --host HOST                Address to listen on in SSE mode (default 127.0.0.1)\n"
        "  --port PORT                Port to listen on in SSE mode (default 3001)\n"
        "  --log-level LEVEL          trace, debug, info, warning, error, critical or off\n"
        "                             (default $" + std::string(ENV_LOG_LEVEL) + " or info)\n"
        "  --converter CMD            Converter command (default $" + std::string(ENV_CONVERTER)
        + " or markitdown)\n"
        "  --converter-timeout SECS   Per-conversion time limit (default 120)\n"
        "  -h, --help                 Show this help and exit\n"
        "  --version                  Show the version and exit\n";
}

} // namespace mdmcp
