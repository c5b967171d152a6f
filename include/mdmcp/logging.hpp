#pragma once
#include <string>
#include <spdlog/common.h>

namespace mdmcp {

constexpr const char* LOGGER_NAME = "markitdown-mcp";

/// Accepts spdlog level names plus "warning" and "critical"/"fatal",
/// case-insensitively. Throws UsageError for anything else.
spdlog::level::level_enum parse_log_level(const std::string& name);

/// Installs a stderr logger named markitdown-mcp as the default logger.
/// stdout is left untouched: it carries stdio frames.
void init_logging(spdlog::level::level_enum level);

} // namespace mdmcp
