#include <benchmark/benchmark.h>
#include "rapidmcp/template.hpp"
#include "rapidmcp/types.hpp"
#include "rapidmcp/validator.hpp"
#include <string>
#include <vector>

using namespace rapidmcp;

static std::vector<ParameterSpec> make_params(int n) {
    std::vector<ParameterSpec> params;
    for (int i = 0; i < n; ++i) {
        ParameterSpec p;
        p.name = "p" + std::to_string(i);
        p.kind = (i % 2 == 0) ? ParamKind::String : ParamKind::Integer;
        p.required = (i % 3 == 0);
        ValidationRule rule;
        if (p.kind == ParamKind::String) {
            rule.max_length = 128;
        } else {
            rule.min = 0;
            rule.max = 1000000;
        }
        p.validation = rule;
        params.push_back(std::move(p));
    }
    return params;
}

static nlohmann::json make_arguments(int n) {
    nlohmann::json args = nlohmann::json::object();
    for (int i = 0; i < n; ++i) {
        std::string name = "p" + std::to_string(i);
        if (i % 2 == 0) {
            args[name] = "value-" + std::to_string(i);
        } else {
            args[name] = i * 10;
        }
    }
    return args;
}

static void BM_ValidateValid(benchmark::State& state) {
    int n = static_cast<int>(state.range(0));
    auto params = make_params(n);
    auto args = make_arguments(n);
    Validator validator;

    for (auto _ : state) {
        auto result = validator.validate(params, args);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ValidateValid)->Arg(2)->Arg(10)->Arg(50);

static void BM_ValidateAllInvalid(benchmark::State& state) {
    auto params = make_params(10);
    nlohmann::json args = nlohmann::json::object();
    for (int i = 0; i < 10; ++i) {
        args["p" + std::to_string(i)] = nullptr;
    }
    args["unexpected"] = true;
    Validator validator;

    for (auto _ : state) {
        auto result = validator.validate(params, args);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ValidateAllInvalid)->MinTime(1.0);

static void BM_ValidateEnforcedPattern(benchmark::State& state) {
    ParameterSpec branch;
    branch.name = "branch";
    ValidationRule rule;
    rule.pattern = "^[A-Za-z0-9._/-]+$";
    branch.validation = rule;
    std::vector<ParameterSpec> params{branch};
    nlohmann::json args = {{"branch", "feature/faster-dispatch"}};
    Validator validator{ValidatorOptions{regex_pattern_matcher()}};

    for (auto _ : state) {
        auto result = validator.validate(params, args);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ValidateEnforcedPattern)->MinTime(1.0);

static void BM_TemplateCompile(benchmark::State& state) {
    std::string source;
    for (int i = 0; i < 20; ++i) {
        source += "Step " + std::to_string(i) + ": handle {{p" + std::to_string(i) + "}}.\n";
    }

    for (auto _ : state) {
        auto tmpl = PromptTemplate::compile(source);
        benchmark::DoNotOptimize(tmpl);
    }
}
BENCHMARK(BM_TemplateCompile)->MinTime(1.0);

static void BM_TemplateRender(benchmark::State& state) {
    int n = static_cast<int>(state.range(0));
    std::string source;
    for (int i = 0; i < n; ++i) {
        source += "Step " + std::to_string(i) + ": handle {{p" + std::to_string(i) + "}}.\n";
    }
    auto tmpl = PromptTemplate::compile(source);
    auto args = make_arguments(n);

    for (auto _ : state) {
        auto text = tmpl.render(args);
        benchmark::DoNotOptimize(text);
    }
}
BENCHMARK(BM_TemplateRender)->Arg(1)->Arg(20)->Arg(100);

static void BM_BlockTemplateRender(benchmark::State& state) {
    const std::string source =
        "Release notes from {{from}} to {{to}}.\n"
        "{{#if audiences}}Audiences:{{#each audiences}} {{@index}}={{this}}{{/each}}\n"
        "{{else}}General audience.\n{{/if}}"
        "{{#unless authors}}Omit author names.{{/unless}}";
    nlohmann::json args = {
        {"from", "v1.0.0"},
        {"to", "HEAD"},
        {"audiences", {"users", "operators", "developers"}},
        {"authors", false}
    };
    BlockTemplateExtension extension;
    RenderOptions opts;
    opts.extension = &extension;
    auto tmpl = PromptTemplate::compile(source);

    for (auto _ : state) {
        auto text = tmpl.render(args, opts);
        benchmark::DoNotOptimize(text);
    }
}
BENCHMARK(BM_BlockTemplateRender)->MinTime(1.0);
