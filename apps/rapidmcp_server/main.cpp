/// rapidmcp-server: serves YAML-defined commands as MCP tools.
/// Usage: ./rapidmcp-server [--commands DIR] [--log-level LEVEL] ...
/// Communicates over stdio (newline-delimited JSON-RPC); logs go to stderr.

#include <rapidmcp/rapidmcp.hpp>
#include <spdlog/spdlog.h>
#include <csignal>
#include <iostream>

int main(int argc, char** argv) {
    rapidmcp::ServerConfig cfg;
    try {
        cfg = rapidmcp::parse_config(argc, argv);
    } catch (const rapidmcp::ConfigError& e) {
        std::cerr << argv[0] << ": " << e.what() << "\n" << rapidmcp::usage(argv[0]);
        return 2;
    }
    if (cfg.show_help) {
        std::cout << rapidmcp::usage(argv[0]);
        return 0;
    }
    if (cfg.show_version) {
        std::cout << rapidmcp::SERVER_NAME << " " << rapidmcp::SERVER_VERSION
                  << " (MCP " << rapidmcp::PROTOCOL_VERSION << ")\n";
        return 0;
    }

    // A client closing its end must not kill us mid-write.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        rapidmcp::init_logging(cfg.log_level, cfg.log_file);
        spdlog::info("Starting {} {}", rapidmcp::SERVER_NAME, rapidmcp::SERVER_VERSION);

        auto registry = rapidmcp::load_registry(cfg.commands_dir);

        rapidmcp::McpServer::Options opts;
        opts.enforce_patterns = cfg.enforce_patterns;
        opts.template_extensions = cfg.template_extensions;
        opts.exec_timeout = cfg.exec_timeout;
        if (cfg.allow_exec) {
            opts.tool_invoker = std::make_shared<rapidmcp::ProcessToolInvoker>();
        }

        rapidmcp::McpServer server{registry, std::move(opts)};
        if (cfg.check_only) {
            spdlog::info("{} command(s) OK", registry->size());
            return 0;
        }

        // Blocks until EOF
        server.serve_stdio();
    } catch (const rapidmcp::McpError& e) {
        spdlog::critical("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("unexpected error: {}", e.what());
        return 1;
    }
    return 0;
}
