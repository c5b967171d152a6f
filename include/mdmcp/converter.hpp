#pragma once
#include "capability.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace mdmcp {

constexpr const char* CONVERT_CAPABILITY_ID = "convert_to_markdown";

/// Converts the resource behind a URI to Markdown.
class Converter {
public:
    virtual ~Converter() = default;

    /// Throws ConversionError for unreachable, unsupported or malformed URIs.
    virtual std::string convert(const std::string& uri) = 0;
};

/// Runs an external converter program as `<command> [args...] <uri>` and
/// returns what it prints on stdout.
class CommandConverter : public Converter {
public:
    struct Options {
        std::string command = "markitdown";
        std::vector<std::string> args;
        std::chrono::milliseconds timeout{120000};
    };

    explicit CommandConverter(Options opts);

    std::string convert(const std::string& uri) override;

    const Options& options() const { return opts_; }

private:
    Options opts_;
};

/// Lower-cased scheme of `uri`, or empty when it has none.
std::string uri_scheme(const std::string& uri);

/// True for the schemes the converter accepts: http, https, file, data.
bool is_supported_uri(const std::string& uri);

/// Builds the convert_to_markdown capability (one required string field
/// `uri`) bound to `converter`.
Capability make_convert_capability(std::shared_ptr<Converter> converter);

} // namespace mdmcp
