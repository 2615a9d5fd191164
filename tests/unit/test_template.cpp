#include <gtest/gtest.h>
#include "rapidmcp/template.hpp"
#include "rapidmcp/error.hpp"

using namespace rapidmcp;

// ---- Compile ----

TEST(TemplateCompile, SplitsIntoSpans) {
    auto t = PromptTemplate::compile("Fix #{{ issue }} on {{branch}}.");
    const auto& spans = t.spans();
    ASSERT_EQ(spans.size(), 5u);
    EXPECT_EQ(spans[0], (TemplateSpan{TemplateSpan::Kind::Literal, "Fix #"}));
    EXPECT_EQ(spans[1], (TemplateSpan{TemplateSpan::Kind::Placeholder, "issue"}));
    EXPECT_EQ(spans[2], (TemplateSpan{TemplateSpan::Kind::Literal, " on "}));
    EXPECT_EQ(spans[3], (TemplateSpan{TemplateSpan::Kind::Placeholder, "branch"}));
    EXPECT_EQ(spans[4], (TemplateSpan{TemplateSpan::Kind::Literal, "."}));
    EXPECT_FALSE(t.has_blocks());
}

TEST(TemplateCompile, PlaceholderNamesInFirstOccurrenceOrder) {
    auto t = PromptTemplate::compile("{{b}} {{a}} {{b}}");
    EXPECT_EQ(t.placeholder_names(), (std::vector<std::string>{"b", "a"}));
}

TEST(TemplateCompile, NonIdentifierTagsStayLiteral) {
    auto t = PromptTemplate::compile("a {{not valid}} b {{1x}} c {{}}");
    EXPECT_TRUE(t.placeholder_names().empty());
    EXPECT_EQ(t.render(nlohmann::json::object()), "a {{not valid}} b {{1x}} c {{}}");
}

TEST(TemplateCompile, UnterminatedTagIsLiteral) {
    auto t = PromptTemplate::compile("value: {{name");
    EXPECT_EQ(t.render({{"name", "x"}}), "value: {{name");
}

TEST(TemplateCompile, DetectsBlocks) {
    EXPECT_TRUE(PromptTemplate::compile("{{#if x}}y{{/if}}").has_blocks());
    EXPECT_TRUE(PromptTemplate::compile("{{else}}").has_blocks());
    EXPECT_FALSE(PromptTemplate::compile("{{x}}").has_blocks());
}

// ---- Flat render ----

TEST(TemplateRender, ValueFormatting) {
    auto t = PromptTemplate::compile("{{s}}|{{i}}|{{f}}|{{b}}|{{a}}|{{o}}|{{n}}");
    nlohmann::json args = {
        {"s", "text"},
        {"i", 42},
        {"f", 2.5},
        {"b", true},
        {"a", {1, "x"}},
        {"o", {{"k", 1}}},
        {"n", nullptr}
    };
    EXPECT_EQ(t.render(args), R"(text|42|2.5|true|[1,"x"]|{"k":1}|null)");
}

TEST(TemplateRender, StringsAreNotEscaped) {
    auto t = PromptTemplate::compile("<{{x}}>");
    EXPECT_EQ(t.render({{"x", "a\"b\n{{y}}"}}), "<a\"b\n{{y}}>");
}

TEST(TemplateRender, MissingUsesMarker) {
    auto t = PromptTemplate::compile("[{{absent}}]");
    EXPECT_EQ(t.render(nlohmann::json::object()), "[]");

    RenderOptions opts;
    opts.missing_marker = "<missing>";
    EXPECT_EQ(t.render(nlohmann::json::object(), opts), "[<missing>]");
}

TEST(TemplateRender, BlocksAreLiteralWithoutExtension) {
    auto t = PromptTemplate::compile("{{#if x}}yes{{/if}}");
    EXPECT_EQ(t.render({{"x", true}}), "{{#if x}}yes{{/if}}");
}

TEST(TemplateRender, Idempotent) {
    auto t = PromptTemplate::compile("Run {{cmd}} with {{flag}} in {{dir}}");
    nlohmann::json args = {{"cmd", "make"}, {"flag", false}};
    EXPECT_EQ(t.render(args), t.render(args));
}

TEST(TemplateRender, ValuesSubstituteExactly) {
    auto t = PromptTemplate::compile("{{a}}-{{b}}-{{a}}");
    EXPECT_EQ(t.render({{"a", "x{{b}}"}, {"b", 7}}), "x{{b}}-7-x{{b}}");
}

TEST(TemplateRender, TextWithoutPlaceholders) {
    auto t = PromptTemplate::compile("plain text");
    EXPECT_EQ(t.render(nlohmann::json::object()), "plain text");
    EXPECT_EQ(PromptTemplate::compile("").render(nlohmann::json::object()), "");
}

TEST(TemplateHelpers, IsValidIdentifier) {
    EXPECT_TRUE(is_valid_identifier("issue_number"));
    EXPECT_TRUE(is_valid_identifier("_x1"));
    EXPECT_FALSE(is_valid_identifier(""));
    EXPECT_FALSE(is_valid_identifier("1abc"));
    EXPECT_FALSE(is_valid_identifier("with-dash"));
    EXPECT_FALSE(is_valid_identifier("a b"));
}

// ---- Block extension ----

class BlockTemplateTest : public ::testing::Test {
protected:
    std::string render(const std::string& src, const nlohmann::json& args) {
        RenderOptions opts;
        opts.extension = &ext_;
        return PromptTemplate::compile(src).render(args, opts);
    }

    BlockTemplateExtension ext_;
};

TEST_F(BlockTemplateTest, IfElse) {
    const std::string src = "{{#if verbose}}loud{{else}}quiet{{/if}}";
    EXPECT_EQ(render(src, {{"verbose", true}}), "loud");
    EXPECT_EQ(render(src, {{"verbose", false}}), "quiet");
    EXPECT_EQ(render(src, nlohmann::json::object()), "quiet");
}

TEST_F(BlockTemplateTest, Truthiness) {
    const std::string src = "{{#if v}}T{{else}}F{{/if}}";
    EXPECT_EQ(render(src, {{"v", ""}}), "F");
    EXPECT_EQ(render(src, {{"v", "x"}}), "T");
    EXPECT_EQ(render(src, {{"v", 0}}), "F");
    EXPECT_EQ(render(src, {{"v", 3}}), "T");
    EXPECT_EQ(render(src, {{"v", nlohmann::json::array()}}), "F");
    EXPECT_EQ(render(src, {{"v", nullptr}}), "F");
}

TEST_F(BlockTemplateTest, Unless) {
    EXPECT_EQ(render("{{#unless draft}}publish{{/unless}}", {{"draft", false}}), "publish");
    EXPECT_EQ(render("{{#unless draft}}publish{{/unless}}", {{"draft", true}}), "");
}

TEST_F(BlockTemplateTest, EachWithThisAndIndex) {
    nlohmann::json args = {{"items", {"a", "b", "c"}}};
    EXPECT_EQ(render("{{#each items}}{{@index}}={{this}};{{/each}}", args), "0=a;1=b;2=c;");
}

TEST_F(BlockTemplateTest, EachElseOnEmpty) {
    nlohmann::json args = {{"items", nlohmann::json::array()}};
    EXPECT_EQ(render("{{#each items}}x{{else}}none{{/each}}", args), "none");
}

TEST_F(BlockTemplateTest, EachSeesOuterScope) {
    nlohmann::json args = {{"repo", "core"}, {"files", {{{"path", "a.cpp"}}, {{"path", "b.cpp"}}}}};
    EXPECT_EQ(render("{{#each files}}{{repo}}/{{path}} {{/each}}", args), "core/a.cpp core/b.cpp ");
}

TEST_F(BlockTemplateTest, Nested) {
    nlohmann::json args = {{"show", true}, {"xs", {1, 2}}};
    EXPECT_EQ(render("{{#if show}}[{{#each xs}}{{this}}{{/each}}]{{/if}}", args), "[12]");
}

TEST_F(BlockTemplateTest, PlainPlaceholdersStillWork) {
    EXPECT_EQ(render("{{#if a}}{{b}}{{/if}}-{{missing}}", {{"a", true}, {"b", 5}}), "5-");
}

TEST_F(BlockTemplateTest, MalformedBlocksThrow) {
    EXPECT_THROW(render("{{#if x}}unclosed", nlohmann::json::object()), TemplateError);
    EXPECT_THROW(render("{{#if x}}a{{/each}}", nlohmann::json::object()), TemplateError);
    EXPECT_THROW(render("stray {{/if}}", nlohmann::json::object()), TemplateError);
    EXPECT_THROW(render("{{#with x}}a{{/with}}", nlohmann::json::object()), TemplateError);
    EXPECT_THROW(render("{{#if}}a{{/if}}", nlohmann::json::object()), TemplateError);
}
