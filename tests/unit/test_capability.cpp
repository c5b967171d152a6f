#include <gtest/gtest.h>
#include "mdmcp/capability.hpp"
#include "mdmcp/error.hpp"
#include <atomic>

using namespace mdmcp;

namespace {

Capability make_echo(std::atomic<int>* calls = nullptr) {
    Capability cap;
    cap.id = "echo";
    cap.description = "Echo the uri";
    cap.input_schema["uri"] = FieldSpec{FieldType::String, true, std::string("Resource URI")};
    cap.input_schema["depth"] = FieldSpec{FieldType::Integer, false, std::nullopt};
    cap.handler = [calls](const nlohmann::json& args) {
        if (calls) ++*calls;
        return args.at("uri").get<std::string>();
    };
    return cap;
}

} // namespace

TEST(CapabilityRegistry, RegisterAndResolve) {
    CapabilityRegistry registry;
    registry.register_capability(make_echo());
    EXPECT_TRUE(registry.contains("echo"));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.resolve("echo").id, "echo");
}

TEST(CapabilityRegistry, DuplicateRegistrationRejected) {
    CapabilityRegistry registry;
    registry.register_capability(make_echo());
    EXPECT_THROW(registry.register_capability(make_echo()), DuplicateCapabilityError);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(CapabilityRegistry, UnknownCapability) {
    CapabilityRegistry registry;
    try {
        (void)registry.resolve("nope");
        FAIL() << "expected UnknownCapabilityError";
    } catch (const UnknownCapabilityError& e) {
        EXPECT_EQ(e.code, error::InvalidParams);
        EXPECT_NE(std::string(e.what()).find("nope"), std::string::npos);
    }
}

TEST(CapabilityRegistry, ListKeepsRegistrationOrder) {
    CapabilityRegistry registry;
    Capability b = make_echo();
    b.id = "b";
    Capability a = make_echo();
    a.id = "a";
    registry.register_capability(std::move(b));
    registry.register_capability(std::move(a));
    auto list = registry.list();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0]->id, "b");
    EXPECT_EQ(list[1]->id, "a");
}

TEST(CapabilityRegistry, InvokeCallsHandlerOnce) {
    std::atomic<int> calls{0};
    CapabilityRegistry registry;
    registry.register_capability(make_echo(&calls));
    auto text = registry.invoke(registry.resolve("echo"), {{"uri", "file:///a.txt"}});
    EXPECT_EQ(text, "file:///a.txt");
    EXPECT_EQ(calls.load(), 1);
}

TEST(CapabilityRegistry, MissingRequiredFieldNeverInvokes) {
    std::atomic<int> calls{0};
    CapabilityRegistry registry;
    registry.register_capability(make_echo(&calls));
    const auto& cap = registry.resolve("echo");

    try {
        (void)registry.invoke(cap, nlohmann::json::object());
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.code, error::InvalidParams);
        EXPECT_STREQ(e.what(), "Missing required parameter: uri");
    }
    EXPECT_THROW((void)registry.invoke(cap, {{"uri", nullptr}}), ValidationError);
    EXPECT_EQ(calls.load(), 0);
}

TEST(CapabilityRegistry, MistypedFieldRejected) {
    std::atomic<int> calls{0};
    CapabilityRegistry registry;
    registry.register_capability(make_echo(&calls));
    const auto& cap = registry.resolve("echo");
    EXPECT_THROW((void)registry.invoke(cap, {{"uri", 42}}), ValidationError);
    EXPECT_THROW((void)registry.invoke(cap, {{"uri", "x"}, {"depth", "deep"}}), ValidationError);
    EXPECT_THROW((void)registry.invoke(cap, nlohmann::json::array()), ValidationError);
    EXPECT_EQ(calls.load(), 0);
}

TEST(CapabilityRegistry, HandlerFailureBecomesConversionError) {
    Capability cap = make_echo();
    cap.handler = [](const nlohmann::json&) -> std::string {
        throw std::runtime_error("disk on fire");
    };
    CapabilityRegistry registry;
    registry.register_capability(std::move(cap));
    try {
        (void)registry.invoke(registry.resolve("echo"), {{"uri", "file:///x"}});
        FAIL() << "expected ConversionError";
    } catch (const ConversionError& e) {
        EXPECT_EQ(e.code, error::ConversionFailed);
        EXPECT_STREQ(e.what(), "disk on fire");
    }
}

TEST(Capability, JsonSchema) {
    auto schema = make_echo().json_schema();
    EXPECT_EQ(schema["type"], "object");
    EXPECT_EQ(schema["properties"]["uri"]["type"], "string");
    EXPECT_EQ(schema["properties"]["uri"]["description"], "Resource URI");
    EXPECT_EQ(schema["properties"]["depth"]["type"], "integer");
    EXPECT_EQ(schema["required"], nlohmann::json::array({"uri"}));
}

TEST(Capability, ToolDefinition) {
    auto def = make_echo().tool_definition();
    EXPECT_EQ(def.name, "echo");
    EXPECT_EQ(def.description, std::optional<std::string>("Echo the uri"));
    EXPECT_EQ(def.input_schema["type"], "object");
}
