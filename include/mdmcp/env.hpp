#pragma once
#include <cstdlib>
#include <string>

namespace mdmcp {

constexpr const char* ENV_LOG_LEVEL = "MARKITDOWN_MCP_LOG_LEVEL";
constexpr const char* ENV_CONVERTER = "MARKITDOWN_MCP_CONVERTER";

/// Value of environment variable `name`, or `fallback` when it is unset or empty.
inline std::string get_env_or(const char* name, const std::string& fallback) {
    if (name == nullptr || *name == '\0') return fallback;
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return fallback;
    return std::string(value);
}

} // namespace mdmcp
