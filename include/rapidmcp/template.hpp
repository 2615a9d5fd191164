#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace rapidmcp {

class TemplateExtension;

struct RenderOptions {
    /// Text substituted for a placeholder whose parameter is absent.
    std::string missing_marker;
    /// Optional renderer for block constructs; flat substitution when null.
    const TemplateExtension* extension = nullptr;
};

struct TemplateSpan {
    enum class Kind { Literal, Placeholder };

    Kind kind;
    std::string text;  // literal text, or the parameter name of a placeholder

    bool operator==(const TemplateSpan& o) const {
        return kind == o.kind && text == o.text;
    }
};

/// A prompt split once into literal and `{{name}}` placeholder spans.
/// Rendering is a single pass over the spans and never fails.
class PromptTemplate {
public:
    PromptTemplate() = default;

    [[nodiscard]] static PromptTemplate compile(std::string_view source);

    [[nodiscard]] std::string render(const nlohmann::json& arguments,
                                     const RenderOptions& opts = {}) const;

    const std::string& source() const { return source_; }
    const std::vector<TemplateSpan>& spans() const { return spans_; }

    /// Names referenced by placeholders, in first-occurrence order.
    std::vector<std::string> placeholder_names() const;

    /// True when the source contains `{{#...}}`, `{{/...}}` or `{{else}}` tags.
    bool has_blocks() const { return has_blocks_; }

private:
    std::string source_;
    std::vector<TemplateSpan> spans_;
    bool has_blocks_ = false;
};

/// Plain-text form of a parameter value: strings verbatim, numbers and
/// booleans in canonical JSON form, containers as compact JSON.
std::string stringify_value(const nlohmann::json& value);

/// True when `name` is usable as a placeholder key.
bool is_valid_identifier(std::string_view name);

/// Extension point for templates that need more than flat substitution.
class TemplateExtension {
public:
    virtual ~TemplateExtension() = default;

    /// Render the full template source. Throws TemplateError on malformed input.
    virtual std::string render(std::string_view source, const nlohmann::json& arguments,
                               const RenderOptions& opts) const = 0;
};

/// Handlebars-style subset: {{#if x}}..{{else}}..{{/if}}, {{#unless x}}..{{/unless}},
/// and {{#each xs}}..{{/each}} with {{this}} and {{@index}} in the loop body.
class BlockTemplateExtension : public TemplateExtension {
public:
    std::string render(std::string_view source, const nlohmann::json& arguments,
                       const RenderOptions& opts) const override;
};

} // namespace rapidmcp
