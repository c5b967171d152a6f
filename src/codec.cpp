#include "mdmcp/codec.hpp"
#include "mdmcp/error.hpp"
#include "mdmcp/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace mdmcp {

namespace {

nlohmann::json to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto as_int = val.get_int64();
            if (as_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_int.value());
            }
            auto as_uint = val.get_uint64();
            if (as_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
        default:
            return nlohmann::json(nullptr);
    }
}

} // anonymous namespace

nlohmann::json Codec::parse_json(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty frame");
    }

    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto err = parser.iterate(padded).get(doc);
    if (err) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(err));
    }

    // Scalars at the document root are not reachable through get_value().
    bool scalar = false;
    if (doc.is_scalar().get(scalar) == simdjson::SUCCESS && scalar) {
        try {
            return nlohmann::json::parse(raw);
        } catch (const nlohmann::json::parse_error& e) {
            throw McpParseError(std::string("JSON parse error: ") + e.what());
        }
    }

    try {
        simdjson::ondemand::value root;
        auto value_err = doc.get_value().get(root);
        if (value_err) {
            throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(value_err));
        }
        nlohmann::json j = to_nlohmann(root);
        if (!doc.at_end()) {
            throw McpParseError("JSON parse error: trailing content after document");
        }
        return j;
    } catch (const simdjson::simdjson_error& e) {
        throw McpParseError(std::string("JSON parse error: ") + e.what());
    }
}

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw McpParseError("Message must be a JSON object", error::InvalidRequest);
    }
    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string()
        || version->get<std::string>() != JSONRPC_VERSION) {
        throw McpParseError("Invalid or missing 'jsonrpc' version, expected '2.0'",
                            error::InvalidRequest);
    }

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");

    try {
        if (has_method) {
            if (!j.at("method").is_string()) {
                throw McpParseError("'method' must be a string", error::InvalidRequest);
            }
            if (j.contains("params") && !j.at("params").is_object() && !j.at("params").is_array()) {
                throw McpParseError("'params' must be an object or array", error::InvalidRequest);
            }
        }

        if (has_method && has_id) {
            if (j.at("id").is_null()) {
                throw McpParseError("Request id must not be null", error::InvalidRequest);
            }
            JsonRpcRequest req;
            from_json(j, req);
            return req;
        }
        if (has_method) {
            JsonRpcNotification notif;
            from_json(j, notif);
            return notif;
        }
        if (has_id && (j.contains("result") || j.contains("error"))) {
            JsonRpcResponse resp;
            from_json(j, resp);
            return resp;
        }
    } catch (const McpParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw McpParseError(std::string("Invalid message: ") + e.what(), error::InvalidRequest);
    }
    throw McpParseError("Cannot determine message type: missing 'method' and 'id'",
                        error::InvalidRequest);
}

DecodedFrame Codec::decode(std::string_view raw) {
    nlohmann::json j = parse_json(raw);

    DecodedFrame frame;
    if (j.is_array()) {
        if (j.empty()) {
            throw McpParseError("Empty batch", error::InvalidRequest);
        }
        frame.batch = true;
        frame.messages.reserve(j.size());
        for (const auto& item : j) {
            frame.messages.push_back(parse_object(item));
        }
    } else {
        frame.messages.push_back(parse_object(j));
    }
    return frame;
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    auto frame = decode(raw);
    if (frame.batch) {
        throw McpParseError("Expected a single message, got a batch", error::InvalidRequest);
    }
    return std::move(frame.messages.front());
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    // Converter output is arbitrary bytes; invalid UTF-8 becomes U+FFFD.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace mdmcp
