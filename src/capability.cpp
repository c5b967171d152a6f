#include "mdmcp/capability.hpp"
#include "mdmcp/error.hpp"
#include <spdlog/spdlog.h>

namespace mdmcp {

namespace {

bool matches(FieldType type, const nlohmann::json& value) {
    switch (type) {
        case FieldType::String:  return value.is_string();
        case FieldType::Number:  return value.is_number();
        case FieldType::Integer: return value.is_number_integer();
        case FieldType::Boolean: return value.is_boolean();
        case FieldType::Object:  return value.is_object();
        case FieldType::Array:   return value.is_array();
    }
    return false;
}

} // anonymous namespace

std::string field_type_name(FieldType type) {
    switch (type) {
        case FieldType::String:  return "string";
        case FieldType::Number:  return "number";
        case FieldType::Integer: return "integer";
        case FieldType::Boolean: return "boolean";
        case FieldType::Object:  return "object";
        case FieldType::Array:   return "array";
    }
    return "string";
}

nlohmann::json Capability::json_schema() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();
    for (const auto& [name, spec] : input_schema) {
        nlohmann::json prop = {{"type", field_type_name(spec.type)}};
        if (spec.description) prop["description"] = *spec.description;
        properties[name] = std::move(prop);
        if (spec.required) required.push_back(name);
    }
    return {
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", std::move(required)}
    };
}

ToolDefinition Capability::tool_definition() const {
    return ToolDefinition{id, description, json_schema()};
}

void CapabilityRegistry::register_capability(Capability capability) {
    if (capabilities_.count(capability.id) > 0) {
        throw DuplicateCapabilityError(capability.id);
    }
    auto owned = std::make_unique<Capability>(std::move(capability));
    order_.push_back(owned.get());
    spdlog::debug("Registered capability '{}'", owned->id);
    capabilities_.emplace(owned->id, std::move(owned));
}

const Capability& CapabilityRegistry::resolve(const std::string& id) const {
    auto it = capabilities_.find(id);
    if (it == capabilities_.end()) {
        throw UnknownCapabilityError(id);
    }
    return *it->second;
}

bool CapabilityRegistry::contains(const std::string& id) const {
    return capabilities_.count(id) > 0;
}

std::vector<const Capability*> CapabilityRegistry::list() const {
    return order_;
}

void CapabilityRegistry::validate(const Capability& capability, const nlohmann::json& arguments) {
    if (!arguments.is_object()) {
        throw ValidationError("Arguments for '" + capability.id + "' must be an object");
    }
    for (const auto& [name, spec] : capability.input_schema) {
        auto it = arguments.find(name);
        if (it == arguments.end() || it->is_null()) {
            if (spec.required) {
                throw ValidationError("Missing required parameter: " + name);
            }
            continue;
        }
        if (!matches(spec.type, *it)) {
            throw ValidationError("Parameter '" + name + "' must be of type "
                                  + field_type_name(spec.type));
        }
    }
}

std::string CapabilityRegistry::invoke(const Capability& capability,
                                       const nlohmann::json& arguments) const {
    validate(capability, arguments);

    if (!capability.handler) {
        throw ConversionError("Capability '" + capability.id + "' has no handler");
    }
    try {
        return capability.handler(arguments);
    } catch (const ConversionError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConversionError(e.what());
    }
}

} // namespace mdmcp
