#include <gtest/gtest.h>
#include "rapidmcp/logging.hpp"
#include "rapidmcp/error.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace rapidmcp;
namespace fs = std::filesystem;

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("rapidmcp_logging_" + std::to_string(::getpid()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        init_logging("warn");
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string read(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path dir_;
};

TEST_F(LoggingTest, StderrLoggerBecomesDefault) {
    init_logging("debug");
    auto logger = spdlog::default_logger();
    EXPECT_EQ(logger->name(), LOGGER_NAME);
    EXPECT_EQ(logger->level(), spdlog::level::debug);
}

TEST_F(LoggingTest, FileLoggerHonorsLevel) {
    auto path = dir_ / "server.log";
    init_logging("info", path.string());

    spdlog::debug("hidden detail");
    spdlog::info("loaded 3 command(s)");
    spdlog::default_logger()->flush();

    auto text = read(path);
    EXPECT_NE(text.find("loaded 3 command(s)"), std::string::npos);
    EXPECT_EQ(text.find("hidden detail"), std::string::npos);
}

TEST_F(LoggingTest, ReinitializingReplacesLogger) {
    init_logging("info", (dir_ / "a.log").string());
    init_logging("error");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::err);
}

TEST_F(LoggingTest, UnwritableFileIsConfigError) {
    auto blocker = dir_ / "not_a_dir";
    std::ofstream(blocker) << "x";
    EXPECT_THROW(init_logging("info", (blocker / "server.log").string()), ConfigError);
}
