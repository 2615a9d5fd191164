#pragma once
#include "error.hpp"
#include "template.hpp"
#include "types.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace rapidmcp {

enum class ToolFailure {
    NotFound,
    AuthFailure,
    NonZeroExit,
    Timeout,
    MalformedOutput
};

std::string_view tool_failure_to_string(ToolFailure failure);

/// Upper bound for any external tool timeout.
constexpr std::chrono::milliseconds MAX_EXEC_TIMEOUT{24 * 60 * 60 * 1000};

class ExternalToolError : public McpError {
public:
    ToolFailure category;
    std::optional<int> exit_code;

    ExternalToolError(ToolFailure category, const std::string& msg,
                      std::optional<int> exit_code = std::nullopt)
        : McpError(msg), category(category), exit_code(exit_code) {}
};

struct ToolInvocation {
    std::string program;
    std::vector<std::string> args;   // argv[1..], passed verbatim, never through a shell
    std::chrono::milliseconds timeout{30000};
    bool expect_json = false;
};

struct ToolOutput {
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<nlohmann::json> json;  // parsed stdout when expect_json
};

/// Runs an external program on behalf of a command.
class ToolInvoker {
public:
    virtual ~ToolInvoker() = default;

    /// Throws ExternalToolError on any failure.
    virtual ToolOutput invoke(const ToolInvocation& invocation) = 0;
};

/// fork/execvp based invoker with piped stdout/stderr and a hard deadline.
class ProcessToolInvoker : public ToolInvoker {
public:
    ToolOutput invoke(const ToolInvocation& invocation) override;
};

/// `metadata.exec` block of a command definition.
struct ExecSpec {
    std::string program;
    std::vector<PromptTemplate> args;
    std::optional<std::chrono::milliseconds> timeout;
    bool json_output = false;
};

/// Reads `metadata.exec`; std::nullopt when the command does not shell out.
/// Throws RegistryError when the block is malformed or an argument template
/// references something other than a declared parameter.
[[nodiscard]] std::optional<ExecSpec> parse_exec_spec(const CommandDefinition& command);

/// Render each argv template against validated arguments (one element per template).
[[nodiscard]] ToolInvocation build_invocation(const ExecSpec& spec,
                                              const nlohmann::json& arguments,
                                              std::chrono::milliseconds default_timeout);

} // namespace rapidmcp
