#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace mdmcp {

enum class TransportMode {
    Stdio,
    Sse
};

struct CliOptions {
    TransportMode mode = TransportMode::Stdio;
    std::string host = "127.0.0.1";
    uint16_t port = 3001;
    std::string log_level = "info";
    /// Converter program followed by its fixed leading arguments.
    std::vector<std::string> converter_command{"markitdown"};
    std::chrono::seconds converter_timeout{120};
    bool help = false;
    bool version = false;
};

/// Parse the command line, falling back to MARKITDOWN_MCP_LOG_LEVEL and
/// MARKITDOWN_MCP_CONVERTER for options not given. Throws UsageError.
CliOptions parse_cli(int argc, const char* const* argv);

std::string usage_text(const std::string& program);

/// Splits a command string on whitespace.
std::vector<std::string> split_command(const std::string& command);

} // namespace mdmcp
