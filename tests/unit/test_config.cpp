#include <gtest/gtest.h>
#include "rapidmcp/config.hpp"
#include "rapidmcp/error.hpp"
#include "rapidmcp/tool_invoker.hpp"
#include <map>

using namespace rapidmcp;

namespace {

EnvLookup env_of(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const char* name) -> const char* {
        auto it = vars.find(name);
        return it == vars.end() ? nullptr : it->second.c_str();
    };
}

const EnvLookup kNoEnv = [](const char*) -> const char* { return nullptr; };

} // namespace

TEST(Config, Defaults) {
    auto cfg = parse_config({}, kNoEnv);
    EXPECT_EQ(cfg.commands_dir, "commands");
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_FALSE(cfg.log_file.has_value());
    EXPECT_FALSE(cfg.enforce_patterns);
    EXPECT_FALSE(cfg.template_extensions);
    EXPECT_FALSE(cfg.allow_exec);
    EXPECT_EQ(cfg.exec_timeout.count(), 30000);
    EXPECT_FALSE(cfg.check_only);
}

TEST(Config, Flags) {
    auto cfg = parse_config({"--commands", "/etc/cmds", "--log-level", "debug",
                             "--log-file=/tmp/rapidmcp.log", "--enforce-patterns",
                             "--template-extensions", "--allow-exec",
                             "--exec-timeout-ms", "500", "--check"},
                            kNoEnv);
    EXPECT_EQ(cfg.commands_dir, "/etc/cmds");
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.log_file, std::optional<std::string>("/tmp/rapidmcp.log"));
    EXPECT_TRUE(cfg.enforce_patterns);
    EXPECT_TRUE(cfg.template_extensions);
    EXPECT_TRUE(cfg.allow_exec);
    EXPECT_EQ(cfg.exec_timeout.count(), 500);
    EXPECT_TRUE(cfg.check_only);
}

TEST(Config, Environment) {
    auto cfg = parse_config({}, env_of({{"RAPIDMCP_COMMANDS_DIR", "/srv/cmds"},
                                        {"RAPIDMCP_LOG_LEVEL", "warn"},
                                        {"RAPIDMCP_ENFORCE_PATTERNS", "1"},
                                        {"RAPIDMCP_ALLOW_EXEC", "true"},
                                        {"RAPIDMCP_TEMPLATE_EXTENSIONS", "0"},
                                        {"RAPIDMCP_EXEC_TIMEOUT_MS", "1200"}}));
    EXPECT_EQ(cfg.commands_dir, "/srv/cmds");
    EXPECT_EQ(cfg.log_level, "warn");
    EXPECT_TRUE(cfg.enforce_patterns);
    EXPECT_TRUE(cfg.allow_exec);
    EXPECT_FALSE(cfg.template_extensions);
    EXPECT_EQ(cfg.exec_timeout.count(), 1200);
}

TEST(Config, FlagsOverrideEnvironment) {
    auto cfg = parse_config({"--commands", "flag-dir", "--log-level", "error"},
                            env_of({{"RAPIDMCP_COMMANDS_DIR", "env-dir"},
                                    {"RAPIDMCP_LOG_LEVEL", "trace"}}));
    EXPECT_EQ(cfg.commands_dir, "flag-dir");
    EXPECT_EQ(cfg.log_level, "error");
}

TEST(Config, HelpAndVersion) {
    EXPECT_TRUE(parse_config({"--help"}, kNoEnv).show_help);
    EXPECT_TRUE(parse_config({"-h"}, kNoEnv).show_help);
    EXPECT_TRUE(parse_config({"--version"}, kNoEnv).show_version);
    EXPECT_NE(usage("rapidmcp-server").find("--commands"), std::string::npos);
}

TEST(Config, InvalidValues) {
    EXPECT_THROW((void)parse_config({"--bogus"}, kNoEnv), ConfigError);
    EXPECT_THROW((void)parse_config({"--commands"}, kNoEnv), ConfigError);
    EXPECT_THROW((void)parse_config({"--log-level", "loud"}, kNoEnv), ConfigError);
    EXPECT_THROW((void)parse_config({"--exec-timeout-ms", "0"}, kNoEnv), ConfigError);
    EXPECT_THROW((void)parse_config({"--exec-timeout-ms", "12abc"}, kNoEnv), ConfigError);
    EXPECT_THROW((void)parse_config({"--check=yes"}, kNoEnv), ConfigError);
    EXPECT_THROW((void)parse_config({}, env_of({{"RAPIDMCP_LOG_LEVEL", "verbose"}})), ConfigError);
    EXPECT_THROW((void)parse_config({}, env_of({{"RAPIDMCP_ALLOW_EXEC", "maybe"}})), ConfigError);
    EXPECT_THROW((void)parse_config({}, env_of({{"RAPIDMCP_EXEC_TIMEOUT_MS", "-5"}})), ConfigError);
}

TEST(Config, TimeoutCeiling) {
    auto ceiling = std::to_string(MAX_EXEC_TIMEOUT.count());
    EXPECT_EQ(parse_config({"--exec-timeout-ms", ceiling}, kNoEnv).exec_timeout, MAX_EXEC_TIMEOUT);
    EXPECT_THROW((void)parse_config({"--exec-timeout-ms", "86400001"}, kNoEnv), ConfigError);
    EXPECT_THROW((void)parse_config({"--exec-timeout-ms=9000000000000000"}, kNoEnv), ConfigError);
    EXPECT_THROW((void)parse_config({}, env_of({{"RAPIDMCP_EXEC_TIMEOUT_MS", "9000000000000000"}})),
                 ConfigError);
}
