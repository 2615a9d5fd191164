#include "rapidmcp/config.hpp"
#include "rapidmcp/error.hpp"
#include "rapidmcp/tool_invoker.hpp"
#include <charconv>
#include <string>
#include <string_view>
#include <system_error>

namespace rapidmcp {

namespace {

bool is_log_level(std::string_view level) {
    return level == "trace" || level == "debug" || level == "info" || level == "warn"
        || level == "error" || level == "critical" || level == "off";
}

std::string checked_level(const std::string& level, const std::string& source) {
    if (!is_log_level(level)) {
        throw ConfigError(source + ": unknown log level '" + level
                          + "' (expected trace|debug|info|warn|error|critical|off)");
    }
    return level;
}

std::chrono::milliseconds checked_timeout(const std::string& text, const std::string& source) {
    long long ms = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), ms);
    if (ec != std::errc() || ptr != text.data() + text.size() || ms <= 0) {
        throw ConfigError(source + ": expected a positive number of milliseconds, got '" + text + "'");
    }
    if (ms > MAX_EXEC_TIMEOUT.count()) {
        throw ConfigError(source + ": timeout above " + std::to_string(MAX_EXEC_TIMEOUT.count())
                          + " ms");
    }
    return std::chrono::milliseconds(ms);
}

bool checked_flag(const std::string& text, const std::string& source) {
    if (text == "1" || text == "true" || text == "yes" || text == "on") return true;
    if (text.empty() || text == "0" || text == "false" || text == "no" || text == "off") return false;
    throw ConfigError(source + ": expected 0 or 1, got '" + text + "'");
}

void apply_environment(ServerConfig& cfg, const EnvLookup& env) {
    if (const char* v = env("RAPIDMCP_COMMANDS_DIR"); v && *v) {
        cfg.commands_dir = v;
    }
    if (const char* v = env("RAPIDMCP_LOG_LEVEL"); v && *v) {
        cfg.log_level = checked_level(v, "RAPIDMCP_LOG_LEVEL");
    }
    if (const char* v = env("RAPIDMCP_LOG_FILE"); v && *v) {
        cfg.log_file = std::string(v);
    }
    if (const char* v = env("RAPIDMCP_ENFORCE_PATTERNS")) {
        cfg.enforce_patterns = checked_flag(v, "RAPIDMCP_ENFORCE_PATTERNS");
    }
    if (const char* v = env("RAPIDMCP_TEMPLATE_EXTENSIONS")) {
        cfg.template_extensions = checked_flag(v, "RAPIDMCP_TEMPLATE_EXTENSIONS");
    }
    if (const char* v = env("RAPIDMCP_ALLOW_EXEC")) {
        cfg.allow_exec = checked_flag(v, "RAPIDMCP_ALLOW_EXEC");
    }
    if (const char* v = env("RAPIDMCP_EXEC_TIMEOUT_MS"); v && *v) {
        cfg.exec_timeout = checked_timeout(v, "RAPIDMCP_EXEC_TIMEOUT_MS");
    }
}

} // anonymous namespace

ServerConfig parse_config(const std::vector<std::string>& args, const EnvLookup& env) {
    ServerConfig cfg;
    apply_environment(cfg, env);

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        // Accept both "--flag value" and "--flag=value".
        std::string flag = arg;
        std::optional<std::string> inline_value;
        if (auto eq = arg.find('='); arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            flag = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }
        auto value = [&]() -> std::string {
            if (inline_value) return *inline_value;
            if (i + 1 >= args.size()) {
                throw ConfigError(flag + ": missing value");
            }
            return args[++i];
        };

        if (flag == "--commands") {
            cfg.commands_dir = value();
            if (cfg.commands_dir.empty()) throw ConfigError("--commands: empty directory");
        } else if (flag == "--log-level") {
            cfg.log_level = checked_level(value(), "--log-level");
        } else if (flag == "--log-file") {
            cfg.log_file = value();
        } else if (flag == "--exec-timeout-ms") {
            cfg.exec_timeout = checked_timeout(value(), "--exec-timeout-ms");
        } else if (inline_value) {
            throw ConfigError(flag + ": does not take a value");
        } else if (flag == "--enforce-patterns") {
            cfg.enforce_patterns = true;
        } else if (flag == "--template-extensions") {
            cfg.template_extensions = true;
        } else if (flag == "--allow-exec") {
            cfg.allow_exec = true;
        } else if (flag == "--check") {
            cfg.check_only = true;
        } else if (flag == "-h" || flag == "--help") {
            cfg.show_help = true;
        } else if (flag == "-V" || flag == "--version") {
            cfg.show_version = true;
        } else {
            throw ConfigError("unknown argument '" + arg + "'");
        }
    }
    return cfg;
}

ServerConfig parse_config(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_config(args);
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "\n"
           "Serves YAML-defined commands as MCP tools over stdio.\n"
           "\n"
           "Options:\n"
           "  --commands DIR           command definition directory (RAPIDMCP_COMMANDS_DIR, default: commands)\n"
           "  --log-level LEVEL        trace|debug|info|warn|error|critical|off (RAPIDMCP_LOG_LEVEL, default: info)\n"
           "  --log-file PATH          log to a file instead of stderr (RAPIDMCP_LOG_FILE)\n"
           "  --enforce-patterns       reject string arguments that do not match their pattern\n"
           "  --template-extensions    enable {{#if}}, {{#unless}} and {{#each}} blocks in prompts\n"
           "  --allow-exec             run metadata.exec programs of commands\n"
           "  --exec-timeout-ms N      default external tool timeout (RAPIDMCP_EXEC_TIMEOUT_MS, default: 30000)\n"
           "  --check                  load and validate commands, then exit\n"
           "  -h, --help               show this help\n"
           "  -V, --version            show version\n";
}

} // namespace rapidmcp
