#include "component_logger.hpp"
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <vector>

using namespace logguard;

class LoggerTest : public ::testing::Test {
protected:
  std::filesystem::path testDir;
  std::filesystem::path logFile;

  void SetUp() override {
    testDir = std::filesystem::temp_directory_path() / "logguard_logger_test";
    std::filesystem::remove_all(testDir);
    logFile = testDir / "test.log";
  }

  void TearDown() override {
    LogConfig quiet;
    quiet.consoleOutput = false;
    quiet.level = LogLevel::ERROR;
    Logger::getInstance().configure(quiet);
    std::filesystem::remove_all(testDir);
  }

  void configure(LogLevel level, LogFormat format = LogFormat::TEXT,
                 ComponentSet filter = {}) {
    LogConfig config;
    config.level = level;
    config.format = format;
    config.consoleOutput = false;
    config.fileOutput = true;
    config.logFile = logFile.string();
    config.enableRotation = false;
    config.componentFilter = std::move(filter);
    Logger::getInstance().configure(config);
  }

  std::vector<std::string> readLines() {
    Logger::getInstance().flush();
    std::ifstream in(logFile);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
      lines.push_back(line);
    }
    return lines;
  }
};

TEST_F(LoggerTest, TextFormatIncludesLevelComponentAndContext) {
  configure(LogLevel::DEBUG);
  Logger::getInstance().info("Pipeline", "entry processed", {{"line", "3"}});

  auto lines = readLines();
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_NE(lines[0].find("[INFO ] [Pipeline] entry processed"),
            std::string::npos);
  EXPECT_NE(lines[0].find("| line=3"), std::string::npos);
}

TEST_F(LoggerTest, JsonFormatProducesOneObjectPerLine) {
  configure(LogLevel::DEBUG, LogFormat::JSON);
  Logger::getInstance().warn("Pipeline", "suspicious", {{"rule", "sql_drop"}});

  auto lines = readLines();
  ASSERT_EQ(lines.size(), 1u);
  auto entry = nlohmann::json::parse(lines[0]);
  EXPECT_EQ(entry["level"], "WARN");
  EXPECT_EQ(entry["component"], "Pipeline");
  EXPECT_EQ(entry["message"], "suspicious");
  EXPECT_EQ(entry["context"]["rule"], "sql_drop");
}

TEST_F(LoggerTest, JsonFormatSurvivesInvalidUtf8InMessage) {
  configure(LogLevel::DEBUG, LogFormat::JSON);
  Logger::getInstance().error("Pipeline", std::string("bad \xC3\x28 byte"));

  auto lines = readLines();
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_NO_THROW(nlohmann::json::parse(lines[0]));
}

TEST_F(LoggerTest, MessagesBelowLevelAreDropped) {
  configure(LogLevel::WARN);
  Logger::getInstance().debug("Pipeline", "debug");
  Logger::getInstance().info("Pipeline", "info");
  Logger::getInstance().warn("Pipeline", "warn");

  auto lines = readLines();
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_NE(lines[0].find("warn"), std::string::npos);
}

TEST_F(LoggerTest, ComponentFilterRestrictsOutput) {
  configure(LogLevel::DEBUG, LogFormat::TEXT, {"LogSanitizer"});
  Logger::getInstance().info("ConfigManager", "hidden");
  SanitizerLogger::info("visible {}", 1);

  auto lines = readLines();
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_NE(lines[0].find("[LogSanitizer] visible 1"), std::string::npos);
}

TEST_F(LoggerTest, MetricsCountWarningsAndErrors) {
  configure(LogLevel::DEBUG);
  auto before = Logger::getInstance().getMetrics();

  Logger::getInstance().warn("Pipeline", "w");
  Logger::getInstance().error("Pipeline", "e");
  Logger::getInstance().fatal("Pipeline", "f");

  auto after = Logger::getInstance().getMetrics();
  EXPECT_EQ(after.warningCount.load() - before.warningCount.load(), 1u);
  EXPECT_EQ(after.errorCount.load() - before.errorCount.load(), 2u);
  EXPECT_EQ(after.totalMessages.load() - before.totalMessages.load(), 3u);
}

TEST_F(LoggerTest, RotationMovesFullFileToBackup) {
  LogConfig config;
  config.level = LogLevel::DEBUG;
  config.consoleOutput = false;
  config.fileOutput = true;
  config.logFile = logFile.string();
  config.enableRotation = true;
  config.maxFileSize = 200;
  config.maxBackupFiles = 2;
  Logger::getInstance().configure(config);

  for (int i = 0; i < 10; ++i) {
    Logger::getInstance().info("Pipeline", "rotation message " +
                                               std::to_string(i));
  }
  Logger::getInstance().flush();

  EXPECT_TRUE(std::filesystem::exists(logFile.string() + ".1"));
  EXPECT_LE(std::filesystem::file_size(logFile), 200u);
}

TEST_F(LoggerTest, ComponentLoggerFormatsPlaceholdersInOrder) {
  EXPECT_EQ(SanitizerLogger::format_message("{} of {} lines", 2, 5),
            "2 of 5 lines");
  EXPECT_EQ(SanitizerLogger::format_message("no placeholders", 1),
            "no placeholders");
  EXPECT_EQ(SanitizerLogger::format_message("{} and {}", "one"),
            "one and {}");
  EXPECT_STREQ(LedgerLogger::getComponentName(), "CorruptionLedger");
}
