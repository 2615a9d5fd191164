#include "rapidmcp/registry.hpp"
#include "rapidmcp/error.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstdint>
#include <unordered_set>
#include <utility>

namespace rapidmcp {

namespace {

bool is_numeric(ParamKind kind) {
    return kind == ParamKind::Integer || kind == ParamKind::Number;
}

void check_parameter(const CommandDefinition& command, ParameterSpec& spec) {
    const std::string where = "command '" + command.name + "', parameter '" + spec.name + "'";

    if (!is_valid_identifier(spec.name)) {
        throw RegistryError(where + ": name must match ^[A-Za-z_][A-Za-z0-9_]*$");
    }
    if (spec.required && spec.default_value) {
        spdlog::warn("{}: default ignored on a required parameter", where);
        spec.default_value.reset();
    }
    if (spec.default_value && !value_matches_kind(*spec.default_value, spec.kind)) {
        throw RegistryError(where + ": default is not of type "
                            + std::string(param_kind_to_string(spec.kind)));
    }
    if (!spec.validation) return;

    const ValidationRule& rule = *spec.validation;
    if ((rule.min || rule.max) && !is_numeric(spec.kind)) {
        throw RegistryError(where + ": min/max apply to integer and number parameters only");
    }
    if (rule.min && rule.max && *rule.min > *rule.max) {
        throw RegistryError(where + ": min is greater than max");
    }
    if ((rule.min_length || rule.max_length)
        && spec.kind != ParamKind::String && spec.kind != ParamKind::Array) {
        throw RegistryError(where + ": min_length/max_length apply to string and array parameters only");
    }
    if (rule.min_length && rule.max_length && *rule.min_length > *rule.max_length) {
        throw RegistryError(where + ": min_length is greater than max_length");
    }
    if (rule.pattern && spec.kind != ParamKind::String) {
        throw RegistryError(where + ": pattern applies to string parameters only");
    }
    for (const auto& v : rule.allowed_values) {
        if (!value_matches_kind(v, spec.kind)) {
            throw RegistryError(where + ": allowed value " + v.dump() + " is not of type "
                                + std::string(param_kind_to_string(spec.kind)));
        }
    }
}

nlohmann::json compile_property(const ParameterSpec& spec) {
    nlohmann::json prop = {{"type", spec.kind}};
    if (!spec.description.empty()) prop["description"] = spec.description;
    if (spec.default_value) prop["default"] = *spec.default_value;
    if (!spec.validation) return prop;

    const ValidationRule& rule = *spec.validation;
    // integer bounds stay integral in the schema
    auto bound = [&spec](double d) -> nlohmann::json {
        if (spec.kind == ParamKind::Integer && std::floor(d) == d) {
            return static_cast<int64_t>(d);
        }
        return d;
    };
    if (rule.min) prop["minimum"] = bound(*rule.min);
    if (rule.max) prop["maximum"] = bound(*rule.max);
    if (spec.kind == ParamKind::Array) {
        if (rule.min_length) prop["minItems"] = *rule.min_length;
        if (rule.max_length) prop["maxItems"] = *rule.max_length;
    } else {
        if (rule.min_length) prop["minLength"] = *rule.min_length;
        if (rule.max_length) prop["maxLength"] = *rule.max_length;
    }
    if (!rule.allowed_values.empty()) prop["enum"] = rule.allowed_values;
    if (rule.pattern) prop["pattern"] = *rule.pattern;
    return prop;
}

} // anonymous namespace

nlohmann::json compile_input_schema(const CommandDefinition& command) {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();
    for (const auto& spec : command.parameters) {
        properties[spec.name] = compile_property(spec);
        if (spec.required) required.push_back(spec.name);
    }
    return {
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", std::move(required)}
    };
}

CommandDefinition parse_command_definition(const nlohmann::json& raw) {
    std::string name = "<unnamed>";
    if (raw.is_object() && raw.contains("name") && raw.at("name").is_string()) {
        name = raw.at("name").get<std::string>();
    }
    try {
        return raw.get<CommandDefinition>();
    } catch (const nlohmann::json::exception& e) {
        throw RegistryError("command '" + name + "': " + e.what());
    } catch (const std::invalid_argument& e) {
        throw RegistryError("command '" + name + "': " + e.what());
    }
}

CommandRegistry::CommandRegistry(std::vector<CommandDefinition> commands) {
    commands_.reserve(commands.size());
    for (auto& def : commands) {
        if (def.name.empty()) {
            throw RegistryError("command with empty name");
        }
        if (index_.count(def.name) > 0) {
            throw RegistryError("duplicate command name '" + def.name + "'");
        }

        std::unordered_set<std::string> seen;
        for (auto& spec : def.parameters) {
            if (!seen.insert(spec.name).second) {
                throw RegistryError("command '" + def.name + "': duplicate parameter '"
                                    + spec.name + "'");
            }
            check_parameter(def, spec);
        }

        RegisteredCommand entry;
        entry.descriptor = ToolDescriptor{def.name, def.description, compile_input_schema(def)};
        entry.prompt = PromptTemplate::compile(def.prompt);
        entry.definition = std::move(def);

        index_.emplace(entry.definition.name, commands_.size());
        commands_.push_back(std::move(entry));
    }
}

CommandRegistry CommandRegistry::from_raw(const std::vector<nlohmann::json>& raw) {
    std::vector<CommandDefinition> defs;
    defs.reserve(raw.size());
    for (const auto& r : raw) {
        defs.push_back(parse_command_definition(r));
    }
    return CommandRegistry(std::move(defs));
}

const RegisteredCommand* CommandRegistry::find(std::string_view name) const {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) return nullptr;
    return &commands_[it->second];
}

std::vector<ToolDescriptor> CommandRegistry::descriptors() const {
    std::vector<ToolDescriptor> out;
    out.reserve(commands_.size());
    for (const auto& c : commands_) {
        out.push_back(c.descriptor);
    }
    return out;
}

} // namespace rapidmcp
