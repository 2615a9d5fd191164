#include "rapidmcp/template.hpp"
#include "rapidmcp/error.hpp"
#include <optional>
#include <string>

namespace rapidmcp {

namespace {

struct Tag {
    size_t begin;            // offset of "{{"
    size_t end;              // offset just past "}}"
    std::string_view inner;  // trimmed text between the delimiters
};

std::string_view trim(std::string_view s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::optional<Tag> next_tag(std::string_view s, size_t pos) {
    size_t open = s.find("{{", pos);
    if (open == std::string_view::npos) return std::nullopt;
    size_t close = s.find("}}", open + 2);
    if (close == std::string_view::npos) return std::nullopt;
    return Tag{open, close + 2, trim(s.substr(open + 2, close - open - 2))};
}

bool is_block_tag(std::string_view inner) {
    if (inner == "else") return true;
    return !inner.empty() && (inner.front() == '#' || inner.front() == '/');
}

bool is_ident_start(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

bool is_ident_char(char c) {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

} // anonymous namespace

bool is_valid_identifier(std::string_view name) {
    if (name.empty() || !is_ident_start(name.front())) return false;
    for (char c : name.substr(1)) {
        if (!is_ident_char(c)) return false;
    }
    return true;
}

std::string stringify_value(const nlohmann::json& value) {
    if (value.is_string()) return value.get_ref<const std::string&>();
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ---------- PromptTemplate ----------

PromptTemplate PromptTemplate::compile(std::string_view source) {
    PromptTemplate t;
    t.source_ = std::string(source);

    std::string literal;
    size_t pos = 0;
    while (auto tag = next_tag(source, pos)) {
        literal.append(source.substr(pos, tag->begin - pos));
        if (is_block_tag(tag->inner)) {
            t.has_blocks_ = true;
            literal.append(source.substr(tag->begin, tag->end - tag->begin));
        } else if (is_valid_identifier(tag->inner)) {
            if (!literal.empty()) {
                t.spans_.push_back({TemplateSpan::Kind::Literal, std::move(literal)});
                literal.clear();
            }
            t.spans_.push_back({TemplateSpan::Kind::Placeholder, std::string(tag->inner)});
        } else {
            literal.append(source.substr(tag->begin, tag->end - tag->begin));
        }
        pos = tag->end;
    }
    literal.append(source.substr(pos));
    if (!literal.empty()) {
        t.spans_.push_back({TemplateSpan::Kind::Literal, std::move(literal)});
    }
    return t;
}

std::string PromptTemplate::render(const nlohmann::json& arguments,
                                   const RenderOptions& opts) const {
    if (opts.extension && has_blocks_) {
        return opts.extension->render(source_, arguments, opts);
    }

    std::string out;
    out.reserve(source_.size());
    for (const auto& span : spans_) {
        if (span.kind == TemplateSpan::Kind::Literal) {
            out += span.text;
            continue;
        }
        if (!arguments.is_object()) {
            out += opts.missing_marker;
            continue;
        }
        auto it = arguments.find(span.text);
        out += it != arguments.end() ? stringify_value(*it) : opts.missing_marker;
    }
    return out;
}

std::vector<std::string> PromptTemplate::placeholder_names() const {
    std::vector<std::string> names;
    for (const auto& span : spans_) {
        if (span.kind != TemplateSpan::Kind::Placeholder) continue;
        bool seen = false;
        for (const auto& n : names) {
            if (n == span.text) { seen = true; break; }
        }
        if (!seen) names.push_back(span.text);
    }
    return names;
}

// ---------- BlockTemplateExtension ----------

namespace {

struct Node {
    enum class Kind { Text, Var, If, Each };

    Kind kind;
    std::string text;  // literal text, variable name, or block subject
    bool negate = false;
    std::vector<Node> children;
    std::vector<Node> alternative;
};

class BlockParser {
public:
    explicit BlockParser(std::string_view src) : src_(src) {}

    std::vector<Node> parse() {
        std::string terminator;
        auto nodes = parse_sequence(terminator);
        if (!terminator.empty()) {
            throw TemplateError("unexpected {{" + terminator + "}} without an open block");
        }
        return nodes;
    }

private:
    static void append_text(std::vector<Node>& nodes, std::string_view text) {
        if (text.empty()) return;
        if (!nodes.empty() && nodes.back().kind == Node::Kind::Text) {
            nodes.back().text.append(text);
            return;
        }
        nodes.push_back(Node{Node::Kind::Text, std::string(text), false, {}, {}});
    }

    // Stops at end of input (terminator cleared) or at an {{else}} / {{/x}} tag.
    std::vector<Node> parse_sequence(std::string& terminator) {
        std::vector<Node> nodes;
        while (true) {
            auto tag = next_tag(src_, pos_);
            if (!tag) {
                append_text(nodes, src_.substr(pos_));
                pos_ = src_.size();
                terminator.clear();
                return nodes;
            }
            append_text(nodes, src_.substr(pos_, tag->begin - pos_));
            pos_ = tag->end;

            std::string_view inner = tag->inner;
            if (inner == "else" || (!inner.empty() && inner.front() == '/')) {
                terminator = std::string(inner);
                return nodes;
            }
            if (!inner.empty() && inner.front() == '#') {
                nodes.push_back(parse_block(inner.substr(1)));
            } else if (inner == "this" || inner == "@index" || is_valid_identifier(inner)) {
                nodes.push_back(Node{Node::Kind::Var, std::string(inner), false, {}, {}});
            } else {
                append_text(nodes, src_.substr(tag->begin, tag->end - tag->begin));
            }
        }
    }

    Node parse_block(std::string_view decl) {
        size_t space = decl.find_first_of(" \t");
        if (space == std::string_view::npos) {
            throw TemplateError("block {{#" + std::string(decl) + "}} has no subject");
        }
        std::string keyword(decl.substr(0, space));
        std::string_view subject = trim(decl.substr(space));
        if (subject != "this" && !is_valid_identifier(subject)) {
            throw TemplateError("invalid subject '" + std::string(subject) + "' in {{#" + keyword + "}}");
        }

        Node node{Node::Kind::If, std::string(subject), false, {}, {}};
        if (keyword == "unless") {
            node.negate = true;
        } else if (keyword == "each") {
            node.kind = Node::Kind::Each;
        } else if (keyword != "if") {
            throw TemplateError("unsupported block helper '" + keyword + "'");
        }

        std::string terminator;
        node.children = parse_sequence(terminator);
        if (terminator == "else") {
            node.alternative = parse_sequence(terminator);
        }
        if (terminator.empty()) {
            throw TemplateError("unclosed {{#" + keyword + "}} block");
        }
        if (terminator != "/" + keyword) {
            throw TemplateError("{{" + terminator + "}} does not close {{#" + keyword + "}}");
        }
        return node;
    }

    std::string_view src_;
    size_t pos_ = 0;
};

struct Scope {
    const nlohmann::json* current;
    std::optional<size_t> index;
    const Scope* parent;
};

const nlohmann::json* lookup(std::string_view name, const Scope& scope) {
    if (name == "this") return scope.current;
    for (const Scope* s = &scope; s; s = s->parent) {
        if (!s->current || !s->current->is_object()) continue;
        auto it = s->current->find(std::string(name));
        if (it != s->current->end()) return &*it;
    }
    return nullptr;
}

bool truthy(const nlohmann::json* v) {
    if (!v || v->is_null()) return false;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_number()) return v->get<double>() != 0.0;
    if (v->is_string()) return !v->get_ref<const std::string&>().empty();
    if (v->is_array()) return !v->empty();
    return true;
}

void render_nodes(const std::vector<Node>& nodes, const Scope& scope,
                  const RenderOptions& opts, std::string& out) {
    for (const auto& node : nodes) {
        switch (node.kind) {
            case Node::Kind::Text:
                out += node.text;
                break;
            case Node::Kind::Var: {
                if (node.text == "@index") {
                    out += scope.index ? std::to_string(*scope.index) : opts.missing_marker;
                    break;
                }
                const nlohmann::json* v = lookup(node.text, scope);
                out += v ? stringify_value(*v) : opts.missing_marker;
                break;
            }
            case Node::Kind::If: {
                bool cond = truthy(lookup(node.text, scope)) != node.negate;
                render_nodes(cond ? node.children : node.alternative, scope, opts, out);
                break;
            }
            case Node::Kind::Each: {
                const nlohmann::json* v = lookup(node.text, scope);
                if (!v || !v->is_array() || v->empty()) {
                    render_nodes(node.alternative, scope, opts, out);
                    break;
                }
                for (size_t i = 0; i < v->size(); ++i) {
                    Scope inner{&(*v)[i], i, &scope};
                    render_nodes(node.children, inner, opts, out);
                }
                break;
            }
        }
    }
}

} // anonymous namespace

std::string BlockTemplateExtension::render(std::string_view source,
                                           const nlohmann::json& arguments,
                                           const RenderOptions& opts) const {
    auto nodes = BlockParser(source).parse();
    std::string out;
    out.reserve(source.size());
    Scope root{&arguments, std::nullopt, nullptr};
    render_nodes(nodes, root, opts, out);
    return out;
}

} // namespace rapidmcp
