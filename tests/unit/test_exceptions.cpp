#include "fieldguard/error_codes.hpp"
#include "fieldguard/exceptions.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <vector>

namespace fieldguard {

// Test fixture for exception tests
class ExceptionTest : public ::testing::Test {};

TEST_F(ExceptionTest, BaseExceptionConstruction) {
  std::string testMessage = "Test error message";
  ErrorContext context = {{"key1", "value1"}, {"key2", "value2"}};

  FieldGuardException ex(ErrorCode::INTERNAL_ERROR, testMessage, context);

  EXPECT_EQ(ex.getCode(), ErrorCode::INTERNAL_ERROR);
  EXPECT_EQ(ex.getMessage(), testMessage);
  EXPECT_STREQ(ex.what(), testMessage.c_str());

  const auto &returnedContext = ex.getContext();
  EXPECT_EQ(returnedContext.size(), 2u);
  EXPECT_EQ(returnedContext.at("key1"), "value1");
  EXPECT_EQ(returnedContext.at("key2"), "value2");

  auto now = std::chrono::system_clock::now();
  auto timeDiff =
      std::chrono::duration_cast<std::chrono::seconds>(now - ex.getTimestamp());
  EXPECT_LT(timeDiff.count(), 5);
}

TEST_F(ExceptionTest, CorrelationIdFormat) {
  FieldGuardException ex(ErrorCode::INTERNAL_ERROR, "boom");
  const std::string &id = ex.getCorrelationId();

  ASSERT_EQ(id.size(), 11u);
  EXPECT_EQ(id.substr(0, 3), "FG-");
  EXPECT_EQ(id.find_first_not_of("0123456789abcdef", 3), std::string::npos);

  ex.setCorrelationId("req-42");
  EXPECT_EQ(ex.getCorrelationId(), "req-42");
}

TEST_F(ExceptionTest, CopyKeepsCorrelationId) {
  ConfigException original(ErrorCode::PATTERN_DRIFT, "drift", "validation.rules");
  ConfigException copy = original;

  EXPECT_EQ(copy.getCorrelationId(), original.getCorrelationId());
  EXPECT_EQ(copy.getSection(), "validation.rules");
  EXPECT_EQ(copy.getCode(), ErrorCode::PATTERN_DRIFT);
}

TEST_F(ExceptionTest, SubclassContextCarriesOrigin) {
  ValidationException validation(ErrorCode::PATTERN_VIOLATION, "bad", "ID");
  EXPECT_EQ(validation.getField(), "ID");
  EXPECT_EQ(validation.getContext().at("field"), "ID");

  ConfigException config(ErrorCode::CONFIGURATION_ERROR, "bad", "logging");
  EXPECT_EQ(config.getContext().at("section"), "logging");

  SystemException system(ErrorCode::UNKNOWN_FIELD_KIND, "bad", "PatternRegistry");
  EXPECT_EQ(system.getComponent(), "PatternRegistry");
  EXPECT_EQ(system.getContext().at("component"), "PatternRegistry");
}

TEST_F(ExceptionTest, LogStringTagsCategory) {
  ValidationException validation(ErrorCode::MISSING_VALUE, "Name cannot be empty.",
                                 "Name");
  std::string log = validation.toLogString();
  EXPECT_EQ(log.rfind("[VALIDATION] ", 0), 0u);
  EXPECT_NE(log.find("ErrorCode=MISSING_VALUE"), std::string::npos);
  EXPECT_NE(log.find("Field=\"Name\""), std::string::npos);

  ConfigException config(ErrorCode::UNKNOWN_CHAR_CLASS, "unknown");
  EXPECT_EQ(config.toLogString().rfind("[CONFIG] ", 0), 0u);

  SystemException system(ErrorCode::INTERNAL_ERROR, "oops");
  EXPECT_EQ(system.toLogString().rfind("[SYSTEM] ", 0), 0u);
}

TEST_F(ExceptionTest, JsonSerialization) {
  ValidationException ex(ErrorCode::UNSAFE_CONTENT, "unsafe", "Name",
                         {{"signal", "UnsafeContent"}});
  auto json = nlohmann::json::parse(ex.toJsonString());

  EXPECT_EQ(json["errorCode"].get<int>(), 1004);
  EXPECT_EQ(json["errorName"], "UNSAFE_CONTENT");
  EXPECT_EQ(json["message"], "unsafe");
  EXPECT_EQ(json["correlationId"], ex.getCorrelationId());
  EXPECT_EQ(json["context"]["signal"], "UnsafeContent");
  EXPECT_EQ(json["context"]["field"], "Name");
}

TEST_F(ExceptionTest, TypeChecks) {
  ValidationException validation(ErrorCode::PATTERN_VIOLATION, "x");
  ConfigException config(ErrorCode::CONFIGURATION_ERROR, "x");
  SystemException system(ErrorCode::INTERNAL_ERROR, "x");
  std::runtime_error plain("x");

  EXPECT_TRUE(isValidationError(validation));
  EXPECT_FALSE(isValidationError(config));
  EXPECT_TRUE(isConfigError(config));
  EXPECT_TRUE(isSystemError(system));
  EXPECT_FALSE(isSystemError(plain));

  EXPECT_NE(asException<ConfigException>(config), nullptr);
  EXPECT_EQ(asException<ConfigException>(system), nullptr);
  EXPECT_NE(asException<FieldGuardException>(validation), nullptr);
}

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, EveryCodeHasMetadata) {
  const std::vector<ErrorCode> codes = {
      ErrorCode::MISSING_VALUE,       ErrorCode::LENGTH_VIOLATION,
      ErrorCode::STRUCTURAL_VIOLATION, ErrorCode::PATTERN_VIOLATION,
      ErrorCode::UNSAFE_CONTENT,      ErrorCode::CONFIGURATION_ERROR,
      ErrorCode::CONFIG_PARSE_ERROR,  ErrorCode::PATTERN_DRIFT,
      ErrorCode::UNKNOWN_CHAR_CLASS,  ErrorCode::UNKNOWN_FIELD_KIND,
      ErrorCode::INTERNAL_ERROR};

  for (auto code : codes) {
    EXPECT_EQ(getErrorCodeInfo().count(code), 1u) << static_cast<int>(code);
    EXPECT_STRNE(getErrorCodeDescription(code), "Unknown error");
    EXPECT_NE(errorCodeToString(code), "UNKNOWN_ERROR");
  }
}

TEST_F(ErrorCodeTest, ValidationCodesAreClientErrors) {
  EXPECT_EQ(getDefaultHttpStatus(ErrorCode::PATTERN_VIOLATION), 400);
  EXPECT_EQ(getDefaultHttpStatus(ErrorCode::UNSAFE_CONTENT), 400);
  EXPECT_EQ(getDefaultHttpStatus(ErrorCode::UNKNOWN_FIELD_KIND), 500);
  EXPECT_EQ(getDefaultHttpStatus(ErrorCode::PATTERN_DRIFT), 500);
}

TEST_F(ErrorCodeTest, OnlyUnsafeContentIsSecurityEvent) {
  EXPECT_TRUE(isSecurityEvent(ErrorCode::UNSAFE_CONTENT));
  EXPECT_FALSE(isSecurityEvent(ErrorCode::PATTERN_VIOLATION));
  EXPECT_FALSE(isSecurityEvent(ErrorCode::MISSING_VALUE));
  EXPECT_EQ(getErrorCategory(ErrorCode::UNSAFE_CONTENT), "Security");
  EXPECT_EQ(getErrorCategory(ErrorCode::LENGTH_VIOLATION), "Validation");
}

} // namespace fieldguard
