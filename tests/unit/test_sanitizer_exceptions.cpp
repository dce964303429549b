#include "sanitizer_exceptions.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace logguard;

class SanitizerExceptionsTest : public ::testing::Test {};

TEST_F(SanitizerExceptionsTest, ValidationExceptionRecordsFieldAndValue) {
  ValidationException ex(ErrorCode::INVALID_RANGE, "max_log_size too small",
                         "sanitizer.max_log_size", "-1");

  EXPECT_EQ(ex.getCode(), ErrorCode::INVALID_RANGE);
  EXPECT_EQ(ex.getField(), "sanitizer.max_log_size");
  EXPECT_EQ(ex.getValue(), "-1");
  EXPECT_EQ(ex.getContext().at("field"), "sanitizer.max_log_size");
  EXPECT_STREQ(ex.what(), "max_log_size too small");
  EXPECT_EQ(ex.getCorrelationId().size(), 8u);
}

TEST_F(SanitizerExceptionsTest, LogStringCarriesCategoryAndCode) {
  ValidationException validation(ErrorCode::MISSING_FIELD, "no content",
                                 "content");
  EXPECT_NE(validation.toLogString().find("[VALIDATION]"), std::string::npos);
  EXPECT_NE(validation.toLogString().find("ErrorCode=1001"), std::string::npos);

  SystemException system(ErrorCode::FILE_ERROR, "unreadable", "ConfigManager");
  EXPECT_NE(system.toLogString().find("[SYSTEM]"), std::string::npos);
  EXPECT_NE(system.toLogString().find("Component=\"ConfigManager\""),
            std::string::npos);
}

TEST_F(SanitizerExceptionsTest, JsonStringIsParsable) {
  SanitizerException ex(ErrorCode::INVALID_INPUT, "bad input",
                        {{"line", "4"}});
  ex.setCorrelationId("abc12345");

  auto json = nlohmann::json::parse(ex.toJsonString());
  EXPECT_EQ(json["correlationId"], "abc12345");
  EXPECT_EQ(json["errorCode"], 1000);
  EXPECT_EQ(json["message"], "bad input");
  EXPECT_EQ(json["context"]["line"], "4");
}

TEST_F(SanitizerExceptionsTest, FactoryHelpersBuildExpectedTypes) {
  auto validation = createValidationError("window", "0", "must be positive");
  EXPECT_EQ(validation.getCode(), ErrorCode::INVALID_INPUT);
  EXPECT_EQ(validation.getContext().at("reason"), "must be positive");
  EXPECT_TRUE(isValidationError(validation));
  EXPECT_FALSE(isSystemError(validation));

  auto system = createSystemError(ErrorCode::CONFIGURATION_ERROR,
                                  "ConfigManager", "missing file");
  EXPECT_EQ(system.getComponent(), "ConfigManager");
  EXPECT_EQ(system.getMessage(),
            getErrorCodeDescription(ErrorCode::CONFIGURATION_ERROR));
  EXPECT_TRUE(isSystemError(system));

  std::runtime_error plain("plain");
  EXPECT_FALSE(isValidationError(plain));
  EXPECT_FALSE(isSystemError(plain));
}

TEST_F(SanitizerExceptionsTest, EveryCodeHasDescription) {
  for (auto code : {ErrorCode::INVALID_INPUT, ErrorCode::MISSING_FIELD,
                    ErrorCode::INVALID_FORMAT, ErrorCode::INVALID_RANGE,
                    ErrorCode::INVALID_TYPE, ErrorCode::FILE_ERROR,
                    ErrorCode::RESOURCE_EXHAUSTED,
                    ErrorCode::CONFIGURATION_ERROR}) {
    EXPECT_STRNE(getErrorCodeDescription(code), "Unknown error");
  }
}
