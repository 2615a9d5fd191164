#pragma once
#include <optional>
#include <string>

namespace rapidmcp {

constexpr const char* LOGGER_NAME = "rapidmcp";

/// Install the default spdlog logger. stdout carries the protocol, so logs go
/// to stderr unless `log_file` is given. Throws ConfigError if the file sink
/// cannot be opened.
void init_logging(const std::string& level, const std::optional<std::string>& log_file = std::nullopt);

} // namespace rapidmcp
