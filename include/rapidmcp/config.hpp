#pragma once
#include <chrono>
#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace rapidmcp {

/// Startup settings for rapidmcp-server.
/// Command-line flags override RAPIDMCP_* environment variables.
struct ServerConfig {
    std::string commands_dir = "commands";
    std::string log_level = "info";
    std::optional<std::string> log_file;
    bool enforce_patterns = false;
    bool template_extensions = false;
    bool allow_exec = false;
    std::chrono::milliseconds exec_timeout{30000};
    bool check_only = false;
    bool show_help = false;
    bool show_version = false;
};

/// Environment lookup; returns nullptr when the variable is unset.
using EnvLookup = std::function<const char*(const char*)>;

/// Build a config from the environment and argv (argv[0] is skipped).
/// Throws ConfigError on an unknown flag, a missing flag value or an invalid value.
ServerConfig parse_config(const std::vector<std::string>& args,
                          const EnvLookup& env = [](const char* name) { return std::getenv(name); });

ServerConfig parse_config(int argc, char** argv);

/// Usage text printed by --help.
std::string usage(const std::string& program);

} // namespace rapidmcp
