#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace rapidmcp {

// ---------- Parameter kinds ----------

enum class ParamKind {
    String, Integer, Number, Boolean, Array, Object
};

/// JSON-Schema type keyword for a kind ("string", "integer", ...).
std::string_view param_kind_to_string(ParamKind kind);

/// Parses a kind name; std::nullopt for anything outside the closed set.
std::optional<ParamKind> param_kind_from_string(std::string_view s);

/// True when the runtime JSON value is acceptable for the declared kind.
bool value_matches_kind(const nlohmann::json& value, ParamKind kind);

/// Runtime JSON type name as reported in validation messages.
std::string_view json_type_name(const nlohmann::json& value);

// ---------- Command model ----------

struct ValidationRule {
    std::optional<std::string> pattern;
    std::optional<double> min;
    std::optional<double> max;
    std::optional<uint64_t> min_length;
    std::optional<uint64_t> max_length;
    std::vector<nlohmann::json> allowed_values;

    bool empty() const {
        return !pattern && !min && !max && !min_length && !max_length
               && allowed_values.empty();
    }

    bool operator==(const ValidationRule& o) const {
        return pattern == o.pattern && min == o.min && max == o.max
               && min_length == o.min_length && max_length == o.max_length
               && allowed_values == o.allowed_values;
    }
};

struct ParameterSpec {
    std::string name;
    ParamKind kind = ParamKind::String;
    bool required = false;
    std::string description;
    std::optional<nlohmann::json> default_value;
    std::optional<ValidationRule> validation;

    bool operator==(const ParameterSpec& o) const {
        return name == o.name && kind == o.kind && required == o.required
               && description == o.description && default_value == o.default_value
               && validation == o.validation;
    }
};

struct Example {
    std::string description;
    nlohmann::json arguments = nlohmann::json::object();

    bool operator==(const Example& o) const {
        return description == o.description && arguments == o.arguments;
    }
};

struct CommandDefinition {
    std::string name;
    std::string version = "0.0.0";
    std::string description;
    std::string category = "general";
    std::vector<ParameterSpec> parameters;
    std::vector<Example> examples;
    std::string prompt;
    nlohmann::json metadata = nlohmann::json::object();

    const ParameterSpec* find_parameter(std::string_view param_name) const;

    bool operator==(const CommandDefinition& o) const {
        return name == o.name && version == o.version && description == o.description
               && category == o.category && parameters == o.parameters
               && examples == o.examples && prompt == o.prompt && metadata == o.metadata;
    }
};

// ---------- Wire-facing types ----------

struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;

    bool operator==(const ToolDescriptor& o) const {
        return name == o.name && description == o.description
               && input_schema == o.input_schema;
    }
};

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

struct CallToolResult {
    std::vector<TextContent> content;
    std::optional<nlohmann::json> structured_content;
    bool is_error = false;

    bool operator==(const CallToolResult& o) const {
        return content == o.content && structured_content == o.structured_content
               && is_error == o.is_error;
    }
};

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct InitializeResult {
    std::string protocol_version;
    nlohmann::json capabilities = nlohmann::json::object();
    Implementation server_info;

    bool operator==(const InitializeResult& o) const {
        return protocol_version == o.protocol_version && capabilities == o.capabilities
               && server_info == o.server_info;
    }
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, ParamKind kind);

void to_json(nlohmann::json& j, const ValidationRule& r);
void from_json(const nlohmann::json& j, ValidationRule& r);

void to_json(nlohmann::json& j, const ParameterSpec& p);
void from_json(const nlohmann::json& j, ParameterSpec& p);

void to_json(nlohmann::json& j, const Example& e);
void from_json(const nlohmann::json& j, Example& e);

void to_json(nlohmann::json& j, const CommandDefinition& c);
void from_json(const nlohmann::json& j, CommandDefinition& c);

void to_json(nlohmann::json& j, const ToolDescriptor& t);
void from_json(const nlohmann::json& j, ToolDescriptor& t);

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);

void to_json(nlohmann::json& j, const CallToolResult& t);
void from_json(const nlohmann::json& j, CallToolResult& t);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void to_json(nlohmann::json& j, const InitializeResult& t);
void from_json(const nlohmann::json& j, InitializeResult& t);

} // namespace rapidmcp
