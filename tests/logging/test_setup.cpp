#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "logging/setup.hpp"

using namespace emuflow;
namespace fs = std::filesystem;

class LoggingSetupTest : public ::testing::Test {
protected:
    void SetUp() override {
        logDir = fs::temp_directory_path() / "emuflow_logging_test";
        fs::remove_all(logDir);
    }

    void TearDown() override {
        logging::initDefaultLogging();
        fs::remove_all(logDir);
    }

    fs::path logDir;
};

TEST_F(LoggingSetupTest, LevelNames) {
    EXPECT_EQ(logging::levelFromString("trace"), spdlog::level::trace);
    EXPECT_EQ(logging::levelFromString("warning"), spdlog::level::warn);
    EXPECT_EQ(logging::levelFromString("err"), spdlog::level::err);
    EXPECT_EQ(logging::levelFromString("off"), spdlog::level::off);
    EXPECT_EQ(logging::levelFromString("bogus"), spdlog::level::info);
}

TEST_F(LoggingSetupTest, FileSinkReceivesMessages) {
    config::LoggingConfig cfg;
    cfg.enableConsole = false;
    cfg.enableFile = true;
    cfg.logDir = logDir.string();
    cfg.logFilename = "run";
    cfg.fileLevel = "debug";
    logging::initLogging(cfg);

    spdlog::debug("debug message");
    spdlog::trace("trace message");
    spdlog::default_logger()->flush();

    std::ifstream file(logDir / "run.log");
    ASSERT_TRUE(file.is_open());
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_NE(content.str().find("debug message"), std::string::npos);
    EXPECT_EQ(content.str().find("trace message"), std::string::npos);
}

TEST_F(LoggingSetupTest, LoggerLevelIsLowestSinkLevel) {
    config::LoggingConfig cfg;
    cfg.consoleLevel = "warn";
    cfg.enableFile = true;
    cfg.logDir = logDir.string();
    cfg.fileLevel = "debug";
    logging::initLogging(cfg);

    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);
    EXPECT_EQ(spdlog::default_logger()->sinks().size(), 2);
}

TEST_F(LoggingSetupTest, SetLevelAppliesToAllSinks) {
    logging::initDefaultLogging();
    logging::setLevel("error");

    auto logger = spdlog::default_logger();
    EXPECT_EQ(logger->level(), spdlog::level::err);
    for (const auto& sink : logger->sinks()) {
        EXPECT_EQ(sink->level(), spdlog::level::err);
    }
}
