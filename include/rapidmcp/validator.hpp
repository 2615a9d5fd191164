#pragma once
#include "types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace rapidmcp {

enum class FieldErrorType {
    MissingRequired,
    UnknownParameter,
    TypeMismatch,
    ConstraintViolation
};

std::string_view field_error_type_to_string(FieldErrorType type);

struct FieldError {
    std::string field;
    FieldErrorType type;
    std::string message;
    std::optional<std::string> rule;  // set for constraint violations

    bool operator==(const FieldError& o) const {
        return field == o.field && type == o.type && message == o.message && rule == o.rule;
    }
};

void to_json(nlohmann::json& j, const FieldError& e);

struct ValidationResult {
    /// Accepted arguments with defaults filled in; meaningful only when ok().
    nlohmann::json arguments = nlohmann::json::object();
    std::vector<FieldError> errors;

    bool ok() const { return errors.empty(); }
};

enum class PatternMatch { Match, NoMatch, InvalidPattern };

using PatternMatcher = std::function<PatternMatch(const std::string& pattern,
                                                  const std::string& value)>;

struct ValidatorOptions {
    /// Enforces ValidationRule::pattern when set; patterns are documentation only otherwise.
    PatternMatcher pattern_matcher;
};

/// Checks client arguments against a command's parameter list.
/// Total: every problem across every field is reported, nothing is thrown.
class Validator {
public:
    Validator() = default;
    explicit Validator(ValidatorOptions opts);

    [[nodiscard]] ValidationResult validate(const std::vector<ParameterSpec>& params,
                                            const nlohmann::json& arguments) const;

    bool enforces_patterns() const { return static_cast<bool>(opts_.pattern_matcher); }

private:
    void check_rules(const ParameterSpec& spec, const nlohmann::json& value,
                     std::vector<FieldError>& errors) const;

    ValidatorOptions opts_;
};

/// std::regex (ECMAScript, search semantics) matcher with a compiled-pattern cache.
PatternMatcher regex_pattern_matcher();

/// Number of Unicode code points in a UTF-8 string.
size_t utf8_length(std::string_view s);

} // namespace rapidmcp
