#include "rapidmcp/validator.hpp"
#include <cmath>
#include <memory>
#include <mutex>
#include <regex>
#include <unordered_map>

namespace rapidmcp {

namespace {

std::string format_number(double d) {
    if (std::floor(d) == d && std::fabs(d) < 1e15) {
        return std::to_string(static_cast<long long>(d));
    }
    return nlohmann::json(d).dump();
}

FieldError constraint(const ParameterSpec& spec, const char* rule, std::string message) {
    return FieldError{spec.name, FieldErrorType::ConstraintViolation, std::move(message),
                      std::string(rule)};
}

} // anonymous namespace

std::string_view field_error_type_to_string(FieldErrorType type) {
    switch (type) {
        case FieldErrorType::MissingRequired:     return "missing_required";
        case FieldErrorType::UnknownParameter:    return "unknown_parameter";
        case FieldErrorType::TypeMismatch:        return "type_mismatch";
        case FieldErrorType::ConstraintViolation: return "constraint_violation";
    }
    return "constraint_violation";
}

void to_json(nlohmann::json& j, const FieldError& e) {
    j = {
        {"field", e.field},
        {"error_type", std::string(field_error_type_to_string(e.type))},
        {"message", e.message}
    };
    if (e.rule) j["rule"] = *e.rule;
}

size_t utf8_length(std::string_view s) {
    size_t count = 0;
    for (unsigned char c : s) {
        // continuation bytes are 10xxxxxx
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

Validator::Validator(ValidatorOptions opts) : opts_(std::move(opts)) {}

ValidationResult Validator::validate(const std::vector<ParameterSpec>& params,
                                     const nlohmann::json& arguments) const {
    ValidationResult result;

    if (!arguments.is_null() && !arguments.is_object()) {
        result.errors.push_back({"arguments", FieldErrorType::TypeMismatch,
                                 "Expected object but got " + std::string(json_type_name(arguments)),
                                 std::nullopt});
        return result;
    }
    const nlohmann::json empty = nlohmann::json::object();
    const nlohmann::json& args = arguments.is_object() ? arguments : empty;

    // 1. required parameters that are absent
    for (const auto& spec : params) {
        if (spec.required && !args.contains(spec.name)) {
            result.errors.push_back({spec.name, FieldErrorType::MissingRequired,
                                     "Missing required parameter '" + spec.name + "'",
                                     std::nullopt});
        }
    }

    // 2. closed argument set
    for (auto it = args.begin(); it != args.end(); ++it) {
        bool known = false;
        for (const auto& spec : params) {
            if (spec.name == it.key()) { known = true; break; }
        }
        if (!known) {
            result.errors.push_back({it.key(), FieldErrorType::UnknownParameter,
                                     "Unknown parameter '" + it.key() + "'", std::nullopt});
        }
    }

    // 3-5. kind, rules, defaults
    for (const auto& spec : params) {
        auto it = args.find(spec.name);
        if (it == args.end()) {
            if (!spec.required && spec.default_value) {
                result.arguments[spec.name] = *spec.default_value;
            }
            continue;
        }
        if (!value_matches_kind(*it, spec.kind)) {
            result.errors.push_back({spec.name, FieldErrorType::TypeMismatch,
                                     "Expected " + std::string(param_kind_to_string(spec.kind))
                                         + " but got " + std::string(json_type_name(*it)),
                                     std::nullopt});
            continue;
        }
        size_t before = result.errors.size();
        check_rules(spec, *it, result.errors);
        if (result.errors.size() == before) {
            result.arguments[spec.name] = *it;
        }
    }

    if (!result.ok()) {
        result.arguments = nlohmann::json::object();
    }
    return result;
}

void Validator::check_rules(const ParameterSpec& spec, const nlohmann::json& value,
                            std::vector<FieldError>& errors) const {
    if (!spec.validation) return;
    const ValidationRule& rule = *spec.validation;

    if (value.is_number()) {
        double d = value.get<double>();
        if (rule.min && d < *rule.min) {
            errors.push_back(constraint(spec, "min",
                "Value " + value.dump() + " is below the minimum of " + format_number(*rule.min)));
        }
        if (rule.max && d > *rule.max) {
            errors.push_back(constraint(spec, "max",
                "Value " + value.dump() + " is above the maximum of " + format_number(*rule.max)));
        }
    }

    if (value.is_string() || value.is_array()) {
        size_t length = value.is_string()
            ? utf8_length(value.get_ref<const std::string&>())
            : value.size();
        const char* unit = value.is_string() ? "characters" : "items";
        if (rule.min_length && length < *rule.min_length) {
            errors.push_back(constraint(spec, "min_length",
                "Length " + std::to_string(length) + " is shorter than min_length "
                    + std::to_string(*rule.min_length) + " " + unit));
        }
        if (rule.max_length && length > *rule.max_length) {
            errors.push_back(constraint(spec, "max_length",
                "Length " + std::to_string(length) + " exceeds max_length "
                    + std::to_string(*rule.max_length) + " " + unit));
        }
    }

    if (!rule.allowed_values.empty()) {
        bool allowed = false;
        for (const auto& candidate : rule.allowed_values) {
            if (candidate == value) { allowed = true; break; }
        }
        if (!allowed) {
            errors.push_back(constraint(spec, "allowed_values",
                "Value " + value.dump() + " is not one of "
                    + nlohmann::json(rule.allowed_values).dump()));
        }
    }

    if (rule.pattern && opts_.pattern_matcher && value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        switch (opts_.pattern_matcher(*rule.pattern, text)) {
            case PatternMatch::Match:
                break;
            case PatternMatch::NoMatch:
                errors.push_back(constraint(spec, "pattern",
                    "Value does not match pattern '" + *rule.pattern + "'"));
                break;
            case PatternMatch::InvalidPattern:
                errors.push_back(constraint(spec, "pattern",
                    "Pattern '" + *rule.pattern + "' cannot be evaluated"));
                break;
        }
    }
}

PatternMatcher regex_pattern_matcher() {
    struct Cache {
        std::mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<const std::regex>> compiled;
    };
    auto cache = std::make_shared<Cache>();

    return [cache](const std::string& pattern, const std::string& value) -> PatternMatch {
        std::shared_ptr<const std::regex> re;
        {
            std::lock_guard<std::mutex> lock(cache->mutex);
            auto it = cache->compiled.find(pattern);
            if (it != cache->compiled.end()) {
                re = it->second;
            } else {
                try {
                    re = std::make_shared<const std::regex>(pattern, std::regex::ECMAScript);
                } catch (const std::regex_error&) {
                    re = nullptr;
                }
                cache->compiled.emplace(pattern, re);
            }
        }
        if (!re) return PatternMatch::InvalidPattern;
        try {
            return std::regex_search(value, *re) ? PatternMatch::Match : PatternMatch::NoMatch;
        } catch (const std::regex_error&) {
            // complexity limits on pathological input
            return PatternMatch::InvalidPattern;
        }
    };
}

} // namespace rapidmcp
