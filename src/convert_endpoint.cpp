#include "mdmcp/convert_endpoint.hpp"
#include "mdmcp/codec.hpp"
#include "mdmcp/error.hpp"
#include <spdlog/spdlog.h>

namespace mdmcp {

namespace {

const char* const MISSING_URI = "Missing required parameter: uri";

ConvertEndpoint::Reply error_reply(int status, const std::string& message) {
    return ConvertEndpoint::Reply{status, nlohmann::json{{"error", message}}};
}

} // anonymous namespace

ConvertEndpoint::ConvertEndpoint(std::shared_ptr<const CapabilityRegistry> registry,
                                 std::string capability_id)
    : registry_(std::move(registry))
    , capability_id_(std::move(capability_id)) {
    if (!registry_) {
        throw std::invalid_argument("ConvertEndpoint requires a capability registry");
    }
}

ConvertEndpoint::Reply ConvertEndpoint::handle(std::string_view body) const {
    nlohmann::json request;
    try {
        request = Codec::parse_json(body);
    } catch (const McpParseError& e) {
        spdlog::warn("/convert: unreadable request body: {}", e.what());
        return error_reply(500, e.what());
    }

    if (!request.is_object()) {
        return error_reply(400, MISSING_URI);
    }
    auto uri = request.find("uri");
    if (uri == request.end() || !uri->is_string() || uri->get_ref<const std::string&>().empty()) {
        return error_reply(400, MISSING_URI);
    }

    try {
        const Capability& capability = registry_->resolve(capability_id_);
        std::string markdown = registry_->invoke(capability,
                                                 nlohmann::json{{"uri", uri->get<std::string>()}});
        return Reply{200, nlohmann::json{{"markdown", std::move(markdown)}}};
    } catch (const ValidationError& e) {
        return error_reply(400, e.what());
    } catch (const McpError& e) {
        spdlog::error("/convert of {} failed: {}", uri->get<std::string>(), e.what());
        return error_reply(500, e.what());
    }
}

} // namespace mdmcp
