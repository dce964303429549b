#include "json_repair.hpp"
#include "logger.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace logguard;

class JsonRepairTest : public ::testing::Test {
protected:
  SanitizerConfig config;

  void SetUp() override {
    LogConfig quiet;
    quiet.consoleOutput = false;
    quiet.level = LogLevel::FATAL;
    Logger::getInstance().configure(quiet);
  }

  std::string process(std::string line, SanitizationResult &result) {
    JsonRepair repair(config);
    repair.process(line, 1, result);
    return line;
  }
};

TEST_F(JsonRepairTest, ValidationReportsDepthAndErrors) {
  auto ok = JsonRepair::validate(R"({"a":[1,{"b":2}]})");
  EXPECT_TRUE(ok.success);
  EXPECT_EQ(ok.maxDepth, 3u);

  auto bad = JsonRepair::validate(R"({"a":1,})");
  EXPECT_FALSE(bad.success);
  EXPECT_GT(bad.errorPosition, 0u);
  EXPECT_FALSE(bad.errorMessage.empty());
}

TEST_F(JsonRepairTest, ValidLineIsKeptVerbatim) {
  SanitizationResult result;
  EXPECT_EQ(process(R"({ "b" : 1, "a" : [ true, null ] })", result),
            R"({ "b" : 1, "a" : [ true, null ] })");
  EXPECT_TRUE(result.corruptionsDetected.empty());
  EXPECT_TRUE(result.actionsTaken.empty());
}

TEST_F(JsonRepairTest, TrailingCommaIsRepaired) {
  SanitizationResult result;
  EXPECT_EQ(process(R"({"a":1,})", result), R"({"a":1})");

  ASSERT_EQ(result.corruptionsDetected.size(), 1u);
  const auto &detection = result.corruptionsDetected[0];
  EXPECT_EQ(detection.type, CorruptionType::MALFORMED_JSON);
  EXPECT_EQ(detection.severity, Severity::HIGH);
  EXPECT_DOUBLE_EQ(detection.confidence, 0.9);
  EXPECT_EQ(detection.location.rfind("line_1:pos_", 0), 0u);
  EXPECT_TRUE(result.hasAction(SanitizationAction::SANITIZED));
}

TEST_F(JsonRepairTest, SingleQuotesAndBareKeysAreRepaired) {
  SanitizationResult result;
  auto repaired = process("{'level': 'INFO', msg: 'it\\'s ok',}", result);

  auto parsed = nlohmann::json::parse(repaired);
  EXPECT_EQ(parsed["level"], "INFO");
  EXPECT_EQ(parsed["msg"], "it's ok");
  EXPECT_TRUE(result.hasAction(SanitizationAction::SANITIZED));
}

TEST_F(JsonRepairTest, UnterminatedStringIsTruncatedAndEscaped) {
  const std::string line = R"({"level":"INFO","msg":"cut off)";
  SanitizationResult result;
  auto output = process(line, result);

  EXPECT_TRUE(result.hasCorruption(CorruptionType::MALFORMED_JSON));
  EXPECT_TRUE(result.hasCorruption(CorruptionType::TRUNCATED_LOG));
  EXPECT_TRUE(result.hasAction(SanitizationAction::ESCAPED));

  auto literal = nlohmann::json::parse(output);
  ASSERT_TRUE(literal.is_string());
  EXPECT_EQ(literal.get<std::string>(), line);
}

TEST_F(JsonRepairTest, TrailingEllipsisCountsAsTruncation) {
  SanitizationResult result;
  process(R"({"msg": "partial"}...)", result);
  EXPECT_TRUE(result.hasCorruption(CorruptionType::TRUNCATED_LOG));
}

TEST_F(JsonRepairTest, RepairableLineIsNotReportedTruncated) {
  SanitizationResult result;
  process(R"({"a":1,})", result);
  EXPECT_FALSE(result.hasCorruption(CorruptionType::TRUNCATED_LOG));
}

TEST_F(JsonRepairTest, DeepDocumentIsFlattenedAtLimit) {
  config.maxJsonDepth = 3;
  SanitizationResult result;
  auto output = process(R"({"a":{"b":{"c":{"d":1}}}})", result);

  EXPECT_EQ(output, R"({"a":{"b":{"c":"{\"d\":1}"}}})");
  ASSERT_EQ(result.corruptionsDetected.size(), 1u);
  EXPECT_EQ(result.corruptionsDetected[0].severity, Severity::MEDIUM);
  EXPECT_DOUBLE_EQ(result.corruptionsDetected[0].confidence, 0.8);
  EXPECT_TRUE(result.hasAction(SanitizationAction::SANITIZED));
}

TEST_F(JsonRepairTest, TenThousandLevelsTerminate) {
  const std::string deep =
      std::string(10000, '[') + "1" + std::string(10000, ']');
  SanitizationResult result;
  auto output = process(deep, result);

  auto check = JsonRepair::validate(output);
  EXPECT_TRUE(check.success);
  EXPECT_LE(check.maxDepth, 20u);
  EXPECT_LE(output.size(), static_cast<size_t>(config.maxLineLength));

  SanitizationResult unbalanced;
  auto escaped = process(std::string(10000, '{'), unbalanced);
  EXPECT_TRUE(unbalanced.hasCorruption(CorruptionType::TRUNCATED_LOG));
  EXPECT_TRUE(JsonRepair::validate(escaped).success);
}

TEST_F(JsonRepairTest, EscapedLiteralHonoursLengthLimit) {
  const std::string quotes(100, '"');
  auto literal = JsonRepair::escapeAsString(quotes, 50);

  EXPECT_LE(literal.size(), 50u);
  EXPECT_GE(literal.size(), 44u);
  auto parsed = nlohmann::json::parse(literal);
  ASSERT_TRUE(parsed.is_string());
  EXPECT_EQ(quotes.rfind(parsed.get<std::string>(), 0), 0u);
}

TEST_F(JsonRepairTest, ScannersIgnoreContentInsideStrings) {
  EXPECT_EQ(JsonRepair::stripTrailingCommas(R"({"s":",}","a":[1,2,],})"),
            R"({"s":",}","a":[1,2]})");
  EXPECT_EQ(JsonRepair::quoteBareKeys(R"({key: "x: y", other_key:1})"),
            R"({"key": "x: y", "other_key":1})");

  auto balance = JsonRepair::scanBalance(R"({"a":"[{"})");
  EXPECT_TRUE(balance.balanced());
  EXPECT_EQ(JsonRepair::scanBalance("[[{").openContainers, 3);
}

TEST_F(JsonRepairTest, LooksLikeJsonChecksFirstNonSpace) {
  EXPECT_TRUE(JsonRepair::looksLikeJson("  {\"a\":1}"));
  EXPECT_TRUE(JsonRepair::looksLikeJson("[1]"));
  EXPECT_FALSE(JsonRepair::looksLikeJson("plain text {"));
  EXPECT_FALSE(JsonRepair::looksLikeJson("   "));
}
