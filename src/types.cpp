#include "mdmcp/types.hpp"
#include "mdmcp/error.hpp"
#include <stdexcept>

namespace mdmcp {

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    const std::string type = j.at("type").get<std::string>();
    if (type != "text") {
        throw std::invalid_argument("Unsupported content type: " + type);
    }
    t.text = j.at("text").get<std::string>();
}

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"inputSchema", t.input_schema}};
    if (t.description) j["description"] = *t.description;
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    t.name = j.at("name").get<std::string>();
    t.input_schema = j.at("inputSchema");
    if (j.contains("description")) t.description = j.at("description").get<std::string>();
}

// ---------- CallToolResult ----------

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = {{"content", t.content}, {"isError", t.is_error}};
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    t.content = j.at("content").get<std::vector<TextContent>>();
    t.is_error = j.value("isError", false);
}

// ---------- Capabilities ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    if (j.contains("tools")) t.tools = j.at("tools");
}

// ---------- Implementation ----------

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
    if (t.title) j["title"] = *t.title;
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.at("version").get<std::string>();
    if (j.contains("title")) t.title = j.at("title").get<std::string>();
}

// ---------- Initialize ----------

void from_json(const nlohmann::json& j, InitializeParams& t) {
    if (!j.is_object()) {
        throw ValidationError("initialize params must be an object");
    }
    auto version = j.find("protocolVersion");
    if (version == j.end() || !version->is_string()) {
        throw ValidationError("initialize requires a string 'protocolVersion'");
    }
    t.protocol_version = version->get<std::string>();
    if (j.contains("capabilities") && j.at("capabilities").is_object()) {
        t.capabilities = j.at("capabilities");
    }
    if (j.contains("clientInfo")) {
        try {
            t.client_info = j.at("clientInfo").get<Implementation>();
        } catch (const nlohmann::json::exception& e) {
            throw ValidationError(std::string("Invalid clientInfo: ") + e.what());
        }
    }
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
    if (t.instructions) j["instructions"] = *t.instructions;
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.capabilities = j.at("capabilities").get<ServerCapabilities>();
    t.server_info = j.at("serverInfo").get<Implementation>();
    if (j.contains("instructions")) t.instructions = j.at("instructions").get<std::string>();
}

} // namespace mdmcp
