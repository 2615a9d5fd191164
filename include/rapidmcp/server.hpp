#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "registry.hpp"
#include "tool_invoker.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace rapidmcp {

/// Template name bound to an external tool's output before rendering.
constexpr std::string_view EXEC_OUTPUT_PARAM = "exec_output";

class McpServer {
public:
    struct Options {
        Implementation server_info;
        /// Enforce ValidationRule::pattern with std::regex.
        bool enforce_patterns = false;
        /// Render {{#if}}/{{#unless}}/{{#each}} blocks instead of leaving them literal.
        bool template_extensions = false;
        /// Text substituted for placeholders without a value.
        std::string missing_marker;
        /// Runs `metadata.exec` programs; external tools are disabled when null.
        std::shared_ptr<ToolInvoker> tool_invoker;
        std::chrono::milliseconds exec_timeout{30000};
    };

    /// Throws RegistryError when a command's exec block or block template is malformed.
    McpServer(RegistryHandle registry, Options opts);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /// Process one framed input unit; returns the serialized response, if any.
    [[nodiscard]] std::optional<std::string> handle_unit(std::string_view unit);

    /// Process one parsed message; std::nullopt for notifications.
    [[nodiscard]] std::optional<JsonRpcResponse> handle_message(const JsonRpcMessage& msg);

    // ---- Transport ----
    void serve_stdio();
    void serve(std::unique_ptr<ITransport> transport);
    void shutdown();

    bool is_running() const;

    const CommandRegistry& registry() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rapidmcp
