#include <gtest/gtest.h>
#include "rapidmcp/types.hpp"

using namespace rapidmcp;

TEST(Types, ParamKindNames) {
    EXPECT_EQ(param_kind_to_string(ParamKind::String), "string");
    EXPECT_EQ(param_kind_to_string(ParamKind::Integer), "integer");
    EXPECT_EQ(param_kind_to_string(ParamKind::Number), "number");
    EXPECT_EQ(param_kind_to_string(ParamKind::Boolean), "boolean");
    EXPECT_EQ(param_kind_to_string(ParamKind::Array), "array");
    EXPECT_EQ(param_kind_to_string(ParamKind::Object), "object");

    EXPECT_EQ(*param_kind_from_string("integer"), ParamKind::Integer);
    EXPECT_FALSE(param_kind_from_string("int").has_value());
    EXPECT_FALSE(param_kind_from_string("String").has_value());
}

TEST(Types, ValueMatchesKind) {
    EXPECT_TRUE(value_matches_kind("x", ParamKind::String));
    EXPECT_FALSE(value_matches_kind(42, ParamKind::String));

    EXPECT_TRUE(value_matches_kind(42, ParamKind::Integer));
    EXPECT_FALSE(value_matches_kind(42.0, ParamKind::Integer));
    EXPECT_FALSE(value_matches_kind("42", ParamKind::Integer));

    EXPECT_TRUE(value_matches_kind(42, ParamKind::Number));
    EXPECT_TRUE(value_matches_kind(4.2, ParamKind::Number));

    EXPECT_TRUE(value_matches_kind(false, ParamKind::Boolean));
    EXPECT_FALSE(value_matches_kind(0, ParamKind::Boolean));

    EXPECT_TRUE(value_matches_kind(nlohmann::json::array(), ParamKind::Array));
    EXPECT_TRUE(value_matches_kind(nlohmann::json::object(), ParamKind::Object));
    EXPECT_FALSE(value_matches_kind(nullptr, ParamKind::Object));
}

TEST(Types, JsonTypeName) {
    EXPECT_EQ(json_type_name(1), "integer");
    EXPECT_EQ(json_type_name(1.5), "number");
    EXPECT_EQ(json_type_name("s"), "string");
    EXPECT_EQ(json_type_name(true), "boolean");
    EXPECT_EQ(json_type_name(nullptr), "null");
}

TEST(Types, CommandDefinitionFromJson) {
    auto j = nlohmann::json::parse(R"({
        "name": "gh-work",
        "version": "1.0.0",
        "description": "Work on a GitHub issue",
        "category": "github",
        "parameters": [
            {"name": "issue_number", "type": "integer", "required": true,
             "validation": {"min": 1}},
            {"name": "branch", "type": "string", "default": "main",
             "validation": {"pattern": "^[a-z]+$", "max_length": 100,
                            "allowed_values": ["main", "dev"]}}
        ],
        "examples": [{"description": "issue 42", "arguments": {"issue_number": 42}}],
        "prompt": "Work on #{{issue_number}}",
        "metadata": {"owner": "tools"}
    })");

    auto def = j.get<CommandDefinition>();
    EXPECT_EQ(def.name, "gh-work");
    EXPECT_EQ(def.version, "1.0.0");
    EXPECT_EQ(def.category, "github");
    ASSERT_EQ(def.parameters.size(), 2u);

    const auto& issue = def.parameters[0];
    EXPECT_EQ(issue.kind, ParamKind::Integer);
    EXPECT_TRUE(issue.required);
    ASSERT_TRUE(issue.validation.has_value());
    EXPECT_EQ(*issue.validation->min, 1.0);

    const auto& branch = def.parameters[1];
    EXPECT_FALSE(branch.required);
    ASSERT_TRUE(branch.default_value.has_value());
    EXPECT_EQ(*branch.default_value, "main");
    EXPECT_EQ(*branch.validation->max_length, 100u);
    EXPECT_EQ(branch.validation->allowed_values.size(), 2u);

    ASSERT_EQ(def.examples.size(), 1u);
    EXPECT_EQ(def.examples[0].arguments["issue_number"], 42);
    EXPECT_EQ(def.metadata["owner"], "tools");

    EXPECT_EQ(def.find_parameter("branch"), &def.parameters[1]);
    EXPECT_EQ(def.find_parameter("missing"), nullptr);
}

TEST(Types, CommandDefinitionDefaults) {
    auto def = nlohmann::json{{"name", "x"}, {"prompt", "p"}}.get<CommandDefinition>();
    EXPECT_EQ(def.version, "0.0.0");
    EXPECT_EQ(def.category, "general");
    EXPECT_EQ(def.description, "");
    EXPECT_TRUE(def.parameters.empty());
    EXPECT_TRUE(def.metadata.is_object());
}

TEST(Types, CommandDefinitionRequiresNameAndPrompt) {
    nlohmann::json no_name = {{"prompt", "p"}};
    nlohmann::json no_prompt = {{"name", "x"}};
    EXPECT_THROW((void)no_name.get<CommandDefinition>(), nlohmann::json::exception);
    EXPECT_THROW((void)no_prompt.get<CommandDefinition>(), nlohmann::json::exception);
}

TEST(Types, UnknownParameterTypeRejected) {
    auto j = nlohmann::json::parse(
        R"({"name":"x","prompt":"p","parameters":[{"name":"a","type":"date"}]})");
    EXPECT_THROW((void)j.get<CommandDefinition>(), std::invalid_argument);
}

TEST(Types, CommandDefinitionRoundTrip) {
    CommandDefinition def;
    def.name = "release-notes";
    def.description = "Draft notes";
    def.prompt = "From {{from_tag}}";
    ParameterSpec p;
    p.name = "from_tag";
    p.kind = ParamKind::String;
    p.required = true;
    p.validation = ValidationRule{};
    p.validation->max_length = 40;
    def.parameters.push_back(p);

    nlohmann::json j = def;
    EXPECT_EQ(j["parameters"][0]["type"], "string");
    EXPECT_EQ(j.get<CommandDefinition>(), def);
}

TEST(Types, CallToolResultSerialization) {
    CallToolResult r;
    r.content.push_back(TextContent{"hello"});
    nlohmann::json j = r;
    EXPECT_EQ(j["content"][0]["type"], "text");
    EXPECT_EQ(j["content"][0]["text"], "hello");
    EXPECT_FALSE(j.contains("isError"));
    EXPECT_FALSE(j.contains("structuredContent"));

    r.is_error = true;
    r.structured_content = nlohmann::json{{"error", {{"category", "timeout"}}}};
    j = r;
    EXPECT_EQ(j["isError"], true);
    EXPECT_EQ(j["structuredContent"]["error"]["category"], "timeout");
    EXPECT_EQ(j.get<CallToolResult>(), r);
}

TEST(Types, InitializeResultSerialization) {
    InitializeResult r;
    r.protocol_version = "2024-11-05";
    r.capabilities = {{"tools", nlohmann::json::object()}};
    r.server_info = {"rapidmcp-server", "0.2.0"};
    nlohmann::json j = r;
    EXPECT_EQ(j["protocolVersion"], "2024-11-05");
    EXPECT_TRUE(j["capabilities"].contains("tools"));
    EXPECT_EQ(j["serverInfo"]["name"], "rapidmcp-server");
    EXPECT_EQ(j.get<InitializeResult>(), r);
}

TEST(Types, ToolDescriptorSerialization) {
    ToolDescriptor d{"sanity-check", "Checks things", {{"type", "object"}}};
    nlohmann::json j = d;
    EXPECT_EQ(j["name"], "sanity-check");
    EXPECT_EQ(j["inputSchema"]["type"], "object");
    EXPECT_EQ(j.get<ToolDescriptor>(), d);
}
