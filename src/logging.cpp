#include "rapidmcp/logging.hpp"
#include "rapidmcp/error.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>

namespace rapidmcp {

void init_logging(const std::string& level, const std::optional<std::string>& log_file) {
    spdlog::drop(LOGGER_NAME);

    std::shared_ptr<spdlog::logger> logger;
    if (log_file) {
        try {
            logger = spdlog::basic_logger_mt(LOGGER_NAME, *log_file);
        } catch (const spdlog::spdlog_ex& e) {
            throw ConfigError("cannot open log file '" + *log_file + "': " + e.what());
        }
    } else {
        logger = spdlog::stderr_color_mt(LOGGER_NAME);
    }

    logger->set_level(spdlog::level::from_str(level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

} // namespace rapidmcp
