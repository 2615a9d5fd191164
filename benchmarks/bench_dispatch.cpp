#include <benchmark/benchmark.h>
#include "rapidmcp/server.hpp"
#include "rapidmcp/registry.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace rapidmcp;

// Registry with N commands, each taking one integer and one string parameter
static RegistryHandle make_registry(int n_commands) {
    std::vector<nlohmann::json> raw;
    for (int i = 0; i < n_commands; ++i) {
        raw.push_back({
            {"name", "cmd-" + std::to_string(i)},
            {"description", "Benchmark command " + std::to_string(i)},
            {"prompt", "Handle ticket {{ticket}} on {{branch}} carefully."},
            {"parameters", nlohmann::json::array({
                {{"name", "ticket"}, {"type", "integer"}, {"required", true},
                 {"validation", {{"min", 1}}}},
                {{"name", "branch"}, {"type", "string"}, {"default", "main"},
                 {"validation", {{"max_length", 64}}}}
            })}
        });
    }
    return std::make_shared<const CommandRegistry>(CommandRegistry::from_raw(raw));
}

static void BM_ToolsList(benchmark::State& state) {
    McpServer server{make_registry(static_cast<int>(state.range(0))), McpServer::Options{}};
    const std::string unit = R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})";

    for (auto _ : state) {
        auto out = server.handle_unit(unit);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_ToolsList)->Arg(1)->Arg(10)->Arg(100);

static void BM_ToolsCall(benchmark::State& state) {
    McpServer server{make_registry(100), McpServer::Options{}};
    const std::string unit =
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"cmd-42","arguments":{"ticket":1234}}})";

    for (auto _ : state) {
        auto out = server.handle_unit(unit);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_ToolsCall)->MinTime(1.0);

static void BM_ToolsCallValidationError(benchmark::State& state) {
    McpServer server{make_registry(100), McpServer::Options{}};
    const std::string unit =
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"cmd-42","arguments":{"ticket":"x","extra":1}}})";

    for (auto _ : state) {
        auto out = server.handle_unit(unit);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_ToolsCallValidationError)->MinTime(1.0);

static void BM_UnknownMethod(benchmark::State& state) {
    McpServer server{make_registry(1), McpServer::Options{}};
    const std::string unit = R"({"jsonrpc":"2.0","id":1,"method":"resources/list"})";

    for (auto _ : state) {
        auto out = server.handle_unit(unit);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_UnknownMethod)->MinTime(1.0);

static void BM_ParseErrorRecovery(benchmark::State& state) {
    McpServer server{make_registry(1), McpServer::Options{}};
    const std::string unit = R"({"jsonrpc":"2.0","id":3,"method":)";

    for (auto _ : state) {
        auto out = server.handle_unit(unit);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_ParseErrorRecovery)->MinTime(1.0);
