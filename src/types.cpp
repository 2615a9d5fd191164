#include "rapidmcp/types.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace rapidmcp {

// ---------- ParamKind ----------

std::string_view param_kind_to_string(ParamKind kind) {
    switch (kind) {
        case ParamKind::String:  return "string";
        case ParamKind::Integer: return "integer";
        case ParamKind::Number:  return "number";
        case ParamKind::Boolean: return "boolean";
        case ParamKind::Array:   return "array";
        case ParamKind::Object:  return "object";
    }
    return "string";
}

std::optional<ParamKind> param_kind_from_string(std::string_view s) {
    if (s == "string")  return ParamKind::String;
    if (s == "integer") return ParamKind::Integer;
    if (s == "number")  return ParamKind::Number;
    if (s == "boolean") return ParamKind::Boolean;
    if (s == "array")   return ParamKind::Array;
    if (s == "object")  return ParamKind::Object;
    return std::nullopt;
}

bool value_matches_kind(const nlohmann::json& value, ParamKind kind) {
    switch (kind) {
        case ParamKind::String:  return value.is_string();
        case ParamKind::Integer: return value.is_number_integer();
        case ParamKind::Number:  return value.is_number();
        case ParamKind::Boolean: return value.is_boolean();
        case ParamKind::Array:   return value.is_array();
        case ParamKind::Object:  return value.is_object();
    }
    return false;
}

std::string_view json_type_name(const nlohmann::json& value) {
    if (value.is_number_integer()) return "integer";
    if (value.is_number()) return "number";
    if (value.is_string()) return "string";
    if (value.is_boolean()) return "boolean";
    if (value.is_array()) return "array";
    if (value.is_object()) return "object";
    return "null";
}

void to_json(nlohmann::json& j, ParamKind kind) {
    j = std::string(param_kind_to_string(kind));
}

// ---------- ValidationRule ----------

void to_json(nlohmann::json& j, const ValidationRule& r) {
    j = nlohmann::json::object();
    if (r.pattern) j["pattern"] = *r.pattern;
    if (r.min) j["min"] = *r.min;
    if (r.max) j["max"] = *r.max;
    if (r.min_length) j["min_length"] = *r.min_length;
    if (r.max_length) j["max_length"] = *r.max_length;
    if (!r.allowed_values.empty()) j["allowed_values"] = r.allowed_values;
}

namespace {

uint64_t length_bound(const nlohmann::json& j, const char* key) {
    const auto& v = j.at(key);
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_number_integer() && v.get<int64_t>() >= 0) {
        return static_cast<uint64_t>(v.get<int64_t>());
    }
    throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
}

} // namespace

void from_json(const nlohmann::json& j, ValidationRule& r) {
    if (!j.is_object()) {
        throw std::invalid_argument("validation must be a mapping");
    }
    if (j.contains("pattern")) r.pattern = j.at("pattern").get<std::string>();
    if (j.contains("min")) r.min = j.at("min").get<double>();
    if (j.contains("max")) r.max = j.at("max").get<double>();
    if (j.contains("min_length")) r.min_length = length_bound(j, "min_length");
    if (j.contains("max_length")) r.max_length = length_bound(j, "max_length");
    if (j.contains("allowed_values")) {
        const auto& values = j.at("allowed_values");
        if (!values.is_array()) {
            throw std::invalid_argument("allowed_values must be a list");
        }
        r.allowed_values.assign(values.begin(), values.end());
    }
}

// ---------- ParameterSpec ----------

void to_json(nlohmann::json& j, const ParameterSpec& p) {
    j = {
        {"name", p.name},
        {"type", p.kind},
        {"required", p.required},
        {"description", p.description}
    };
    if (p.default_value) j["default"] = *p.default_value;
    if (p.validation) j["validation"] = *p.validation;
}

void from_json(const nlohmann::json& j, ParameterSpec& p) {
    p.name = j.at("name").get<std::string>();
    const std::string type = j.at("type").get<std::string>();
    auto kind = param_kind_from_string(type);
    if (!kind) {
        throw std::invalid_argument("parameter '" + p.name + "' has unknown type '" + type + "'");
    }
    p.kind = *kind;
    p.required = j.value("required", false);
    p.description = j.value("description", std::string());
    if (j.contains("default") && !j.at("default").is_null()) p.default_value = j.at("default");
    if (j.contains("validation") && !j.at("validation").is_null()) {
        p.validation = j.at("validation").get<ValidationRule>();
    }
}

// ---------- Example ----------

void to_json(nlohmann::json& j, const Example& e) {
    j = {{"description", e.description}, {"arguments", e.arguments}};
}

void from_json(const nlohmann::json& j, Example& e) {
    e.description = j.value("description", std::string());
    if (j.contains("arguments") && !j.at("arguments").is_null()) e.arguments = j.at("arguments");
}

// ---------- CommandDefinition ----------

const ParameterSpec* CommandDefinition::find_parameter(std::string_view param_name) const {
    for (const auto& p : parameters) {
        if (p.name == param_name) return &p;
    }
    return nullptr;
}

void to_json(nlohmann::json& j, const CommandDefinition& c) {
    j = {
        {"name", c.name},
        {"version", c.version},
        {"description", c.description},
        {"category", c.category},
        {"parameters", c.parameters},
        {"examples", c.examples},
        {"prompt", c.prompt},
        {"metadata", c.metadata}
    };
}

void from_json(const nlohmann::json& j, CommandDefinition& c) {
    if (!j.is_object()) {
        throw std::invalid_argument("command definition must be a mapping");
    }
    c.name = j.at("name").get<std::string>();
    c.prompt = j.at("prompt").get<std::string>();
    c.version = j.value("version", std::string("0.0.0"));
    c.description = j.value("description", std::string());
    c.category = j.value("category", std::string("general"));
    if (j.contains("parameters") && !j.at("parameters").is_null()) {
        c.parameters = j.at("parameters").get<std::vector<ParameterSpec>>();
    }
    if (j.contains("examples") && !j.at("examples").is_null()) {
        c.examples = j.at("examples").get<std::vector<Example>>();
    }
    if (j.contains("metadata") && !j.at("metadata").is_null()) {
        c.metadata = j.at("metadata");
        if (!c.metadata.is_object()) {
            throw std::invalid_argument("metadata must be a mapping");
        }
    }
}

// ---------- ToolDescriptor ----------

void to_json(nlohmann::json& j, const ToolDescriptor& t) {
    j = {{"name", t.name}, {"description", t.description}, {"inputSchema", t.input_schema}};
}

void from_json(const nlohmann::json& j, ToolDescriptor& t) {
    t.name = j.at("name").get<std::string>();
    t.description = j.value("description", std::string());
    t.input_schema = j.at("inputSchema");
}

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    t.text = j.at("text").get<std::string>();
}

// ---------- CallToolResult ----------

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = t.content;
    if (t.structured_content) j["structuredContent"] = *t.structured_content;
    if (t.is_error) j["isError"] = t.is_error;
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    if (j.contains("content")) t.content = j.at("content").get<std::vector<TextContent>>();
    if (j.contains("structuredContent")) t.structured_content = j.at("structuredContent");
    if (j.contains("isError")) t.is_error = j.at("isError").get<bool>();
}

// ---------- Initialize ----------

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.at("version").get<std::string>();
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.capabilities = j.at("capabilities");
    t.server_info = j.at("serverInfo").get<Implementation>();
}

} // namespace rapidmcp
