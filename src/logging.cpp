#include "mdmcp/logging.hpp"
#include "mdmcp/error.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>

namespace mdmcp {

spdlog::level::level_enum parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error" || lower == "err") return spdlog::level::err;
    if (lower == "critical" || lower == "fatal") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    throw UsageError("Unknown log level: " + name);
}

void init_logging(spdlog::level::level_enum level) {
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stderr_color_mt(LOGGER_NAME);
    }
    logger->set_level(level);
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e - %n - %l - %v");
    spdlog::set_default_logger(logger);
}

} // namespace mdmcp
