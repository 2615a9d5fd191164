#include "rapidmcp/server.hpp"
#include "rapidmcp/codec.hpp"
#include "rapidmcp/router.hpp"
#include "rapidmcp/error.hpp"
#include "rapidmcp/template.hpp"
#include "rapidmcp/validator.hpp"
#include "rapidmcp/version.hpp"
#include "rapidmcp/transport/stdio_transport.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace rapidmcp {

namespace {

constexpr size_t kLoggedInputLimit = 200;

std::string_view clip(std::string_view s) {
    return s.size() > kLoggedInputLimit ? s.substr(0, kLoggedInputLimit) : s;
}

nlohmann::json tool_error_result(const ExternalToolError& e) {
    nlohmann::json err = {
        {"category", std::string(tool_failure_to_string(e.category))},
        {"message", e.what()}
    };
    if (e.exit_code) err["exit_code"] = *e.exit_code;

    CallToolResult result;
    result.is_error = true;
    result.content.push_back(TextContent{e.what()});
    result.structured_content = nlohmann::json{{"error", std::move(err)}};
    return nlohmann::json(result);
}

} // anonymous namespace

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    RegistryHandle registry;
    Options opts;
    Router router;
    Validator validator;
    BlockTemplateExtension block_extension;
    RenderOptions render_opts;
    std::unordered_map<std::string, ExecSpec> exec_specs;

    // Transport reference for shutdown()
    ITransport* transport{nullptr};
    std::mutex transport_mutex;
    std::atomic<bool> running{false};

    Impl(RegistryHandle r, Options o)
        : registry(std::move(r)), opts(std::move(o)) {
        if (!registry) {
            registry = std::make_shared<const CommandRegistry>();
        }

        ValidatorOptions vopts;
        if (opts.enforce_patterns) {
            vopts.pattern_matcher = regex_pattern_matcher();
        }
        validator = Validator(std::move(vopts));

        render_opts.missing_marker = opts.missing_marker;
        if (opts.template_extensions) {
            render_opts.extension = &block_extension;
        }

        prepare_commands();
    }

    // Load-time checks for what the server layers on top of the registry
    void prepare_commands() {
        for (const auto& cmd : registry->commands()) {
            const auto& def = cmd.definition;
            if (auto spec = parse_exec_spec(def)) {
                if (def.find_parameter(EXEC_OUTPUT_PARAM)) {
                    throw RegistryError("command '" + def.name + "': parameter name '"
                                        + std::string(EXEC_OUTPUT_PARAM)
                                        + "' is reserved for external tool output");
                }
                exec_specs.emplace(def.name, std::move(*spec));
            }
            if (!render_opts.extension && cmd.prompt.has_blocks()) {
                spdlog::warn("command '{}': prompt uses block tags, which render literally "
                             "unless --template-extensions is set", def.name);
            }
            if (render_opts.extension && cmd.prompt.has_blocks()) {
                try {
                    (void)render_opts.extension->render(cmd.prompt.source(),
                                                        nlohmann::json::object(), render_opts);
                } catch (const TemplateError& e) {
                    throw RegistryError("command '" + def.name + "': " + e.what());
                }
            }
        }
    }

    void setup_handlers() {
        // initialize
        router.on_request("initialize", [this](const nlohmann::json& params) -> HandlerResult {
            if (params.is_object() && params.contains("protocolVersion")) {
                spdlog::debug("initialize: client requested protocol {}",
                              params.at("protocolVersion").dump());
            }
            InitializeResult result;
            result.protocol_version = std::string(PROTOCOL_VERSION);
            result.capabilities = nlohmann::json{{"tools", nlohmann::json::object()}};
            result.server_info = opts.server_info;
            return nlohmann::json(result);
        });

        // notifications/initialized
        router.on_notification("notifications/initialized", [](const nlohmann::json&) {
            spdlog::debug("client initialized");
        });

        // tools/list
        router.on_request("tools/list", [this](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json{{"tools", registry->descriptors()}};
        });

        // tools/call
        router.on_request("tools/call", [this](const nlohmann::json& params) -> HandlerResult {
            return call_tool(params);
        });
    }

    HandlerResult call_tool(const nlohmann::json& params) {
        if (!params.is_object()) {
            return JsonRpcError{error::InvalidParams, "tools/call params must be an object",
                                std::nullopt};
        }
        auto name_it = params.find("name");
        if (name_it == params.end() || !name_it->is_string()) {
            return JsonRpcError{error::InvalidParams, "tools/call requires a string 'name'",
                                std::nullopt};
        }
        const std::string name = name_it->get<std::string>();

        const RegisteredCommand* cmd = registry->find(name);
        if (!cmd) {
            return JsonRpcError{error::MethodNotFound, "Unknown tool: " + name,
                                nlohmann::json{{"tool", name}}};
        }

        nlohmann::json arguments = nlohmann::json::object();
        if (auto args_it = params.find("arguments");
            args_it != params.end() && !args_it->is_null()) {
            if (!args_it->is_object()) {
                return JsonRpcError{error::InvalidParams, "'arguments' must be an object",
                                    nlohmann::json{{"tool", name}}};
            }
            arguments = *args_it;
        }

        ValidationResult validation = validator.validate(cmd->definition.parameters, arguments);
        if (!validation.ok()) {
            spdlog::info("tools/call {}: rejected with {} validation error(s)",
                         name, validation.errors.size());
            return JsonRpcError{error::InvalidParams, "Invalid arguments for tool '" + name + "'",
                                nlohmann::json{{"validation_errors", validation.errors}}};
        }

        nlohmann::json values = std::move(validation.arguments);

        auto exec_it = exec_specs.find(name);
        if (exec_it != exec_specs.end()) {
            if (!opts.tool_invoker) {
                spdlog::debug("tools/call {}: external tools disabled, skipping {}",
                              name, exec_it->second.program);
            } else {
                auto invocation = build_invocation(exec_it->second, values, opts.exec_timeout);
                try {
                    ToolOutput output = opts.tool_invoker->invoke(invocation);
                    values[std::string(EXEC_OUTPUT_PARAM)] =
                        output.json ? output.json->dump(2) : output.stdout_text;
                } catch (const ExternalToolError& e) {
                    spdlog::warn("tools/call {}: {} failed ({}): {}", name, invocation.program,
                                 tool_failure_to_string(e.category), e.what());
                    return tool_error_result(e);
                }
            }
        }

        std::string text;
        try {
            text = cmd->prompt.render(values, render_opts);
        } catch (const TemplateError& e) {
            return JsonRpcError{error::InternalError,
                                "Failed to render prompt for tool '" + name + "': " + e.what(),
                                nlohmann::json{{"tool", name}}};
        }

        CallToolResult result;
        result.content.push_back(TextContent{std::move(text)});
        return nlohmann::json(result);
    }
};

// ----------- McpServer -----------

McpServer::McpServer(RegistryHandle registry, Options opts)
    : impl_(std::make_unique<Impl>(std::move(registry), std::move(opts))) {
    if (impl_->opts.server_info.name.empty()) {
        impl_->opts.server_info = {std::string(SERVER_NAME), std::string(SERVER_VERSION)};
    }
    impl_->setup_handlers();
}

McpServer::~McpServer() = default;

std::optional<std::string> McpServer::handle_unit(std::string_view unit) {
    JsonRpcMessage msg;
    try {
        msg = Codec::parse(unit);
    } catch (const McpParseError& e) {
        auto id = Codec::recover_id(unit);
        if (!id) {
            spdlog::warn("dropping unparseable input ({}): {}", e.what(), clip(unit));
            return std::nullopt;
        }
        return Codec::serialize(make_error(std::move(*id), error::ParseError, "Parse error",
                                           nlohmann::json{{"detail", e.what()}}));
    } catch (const McpProtocolError& e) {
        auto id = Codec::recover_id(unit);
        if (!id) {
            spdlog::warn("dropping invalid envelope ({}): {}", e.what(), clip(unit));
            return std::nullopt;
        }
        return Codec::serialize(make_error(std::move(*id), e.code, "Invalid Request",
                                           nlohmann::json{{"detail", e.what()}}));
    }

    auto response = handle_message(msg);
    if (!response) return std::nullopt;
    return Codec::serialize(*response);
}

std::optional<JsonRpcResponse> McpServer::handle_message(const JsonRpcMessage& msg) {
    return impl_->router.dispatch(msg);
}

void McpServer::serve(std::unique_ptr<ITransport> transport) {
    auto* t = transport.get();
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = t;
    }
    impl_->running = true;
    spdlog::info("serving {} command(s)", impl_->registry->size());

    try {
        t->start([this, t](std::string_view unit) {
            auto out = handle_unit(unit);
            if (out) t->send(*out);
        });
    } catch (const McpTransportError& e) {
        spdlog::error("transport failure: {}", e.what());
        impl_->running = false;
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = nullptr;
        throw;
    }

    impl_->running = false;
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    impl_->transport = nullptr;
    spdlog::info("input closed, server stopped");
}

void McpServer::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void McpServer::shutdown() {
    impl_->running = false;
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    if (impl_->transport) {
        impl_->transport->shutdown();
    }
}

bool McpServer::is_running() const {
    return impl_->running;
}

const CommandRegistry& McpServer::registry() const {
    return *impl_->registry;
}

} // namespace rapidmcp
