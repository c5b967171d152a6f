#pragma once
#include "capability.hpp"
#include "converter.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace mdmcp {

/// Plain HTTP convenience endpoint: `{"uri": ...}` in, `{"markdown": ...}`
/// out. Bypasses the MCP session machinery and calls the capability directly.
class ConvertEndpoint {
public:
    struct Reply {
        int status = 200;
        nlohmann::json body;
    };

    explicit ConvertEndpoint(std::shared_ptr<const CapabilityRegistry> registry,
                             std::string capability_id = CONVERT_CAPABILITY_ID);

    /// 200 with `markdown`, 400 on a missing or mistyped uri, 500 otherwise.
    /// Every non-200 body carries an `error` string.
    Reply handle(std::string_view body) const;

private:
    std::shared_ptr<const CapabilityRegistry> registry_;
    std::string capability_id_;
};

} // namespace mdmcp
