#pragma once
#include "types.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace mdmcp {

enum class FieldType {
    String,
    Number,
    Integer,
    Boolean,
    Object,
    Array
};

std::string field_type_name(FieldType type);

struct FieldSpec {
    FieldType type = FieldType::String;
    bool required = false;
    std::optional<std::string> description;
};

/// Handler for one capability. Receives validated arguments, returns the
/// textual result, and reports failure by throwing.
using CapabilityHandler = std::function<std::string(const nlohmann::json& arguments)>;

struct Capability {
    std::string id;
    std::optional<std::string> description;
    std::map<std::string, FieldSpec> input_schema;
    CapabilityHandler handler;

    /// JSON Schema object published through tools/list.
    [[nodiscard]] nlohmann::json json_schema() const;
    [[nodiscard]] ToolDefinition tool_definition() const;
};

/// Holds the capabilities a server exposes. Populated once at startup and
/// shared read-only by every transport adapter afterwards.
class CapabilityRegistry {
public:
    /// Throws DuplicateCapabilityError if the id is already registered.
    void register_capability(Capability capability);

    /// Throws UnknownCapabilityError.
    [[nodiscard]] const Capability& resolve(const std::string& id) const;

    /// Validate `arguments` against the capability's schema, then call its
    /// handler exactly once. Throws ValidationError before invocation, or
    /// ConversionError if the handler fails.
    std::string invoke(const Capability& capability, const nlohmann::json& arguments) const;

    [[nodiscard]] bool contains(const std::string& id) const;
    [[nodiscard]] size_t size() const noexcept { return order_.size(); }

    /// Capabilities in registration order.
    [[nodiscard]] std::vector<const Capability*> list() const;

private:
    static void validate(const Capability& capability, const nlohmann::json& arguments);

    std::unordered_map<std::string, std::unique_ptr<Capability>> capabilities_;
    std::vector<const Capability*> order_;
};

} // namespace mdmcp
