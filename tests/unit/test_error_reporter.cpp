#include "fieldguard/error_reporter.hpp"
#include <gtest/gtest.h>

using namespace fieldguard;

class ErrorReporterTest : public ::testing::Test {
protected:
  PatternRegistry registry_;

  const ValidationRule &rule(FieldKind kind) const {
    return registry_.describe(kind);
  }
};

TEST_F(ErrorReporterTest, JoinNaturalList) {
  EXPECT_EQ(ErrorReporter::joinNaturalList({}), "");
  EXPECT_EQ(ErrorReporter::joinNaturalList({"a"}), "a");
  EXPECT_EQ(ErrorReporter::joinNaturalList({"a", "b"}), "a and b");
  EXPECT_EQ(ErrorReporter::joinNaturalList({"a", "b", "c"}), "a, b, and c");
  EXPECT_EQ(ErrorReporter::joinNaturalList({"x", "y", "z"}, "or"), "x, y, or z");
}

TEST_F(ErrorReporterTest, PatternViolationListsEveryClass) {
  auto rejected = ErrorReporter::reject("Name", RejectionSignal::PatternViolation,
                                        rule(FieldKind::Name));

  EXPECT_EQ(rejected.reason, "Name can only contain letters, numbers, "
                             "underscore, hyphen, dot, and spaces.");
  EXPECT_EQ(rejected.fieldName, "Name");
  EXPECT_EQ(rejected.signal, RejectionSignal::PatternViolation);
  EXPECT_EQ(rejected.allowedCharsDescription,
            rule(FieldKind::Name).allowedCharsDescription());
  EXPECT_EQ(rejected.errorCode(), ErrorCode::PATTERN_VIOLATION);
}

TEST_F(ErrorReporterTest, PatternViolationNamesOffendingCatalogClass) {
  RejectionDetail detail;
  detail.offendingCharacter = ' ';
  auto rejected = ErrorReporter::reject("ID", RejectionSignal::PatternViolation,
                                        rule(FieldKind::Identifier), detail);

  EXPECT_EQ(rejected.reason,
            "ID can only contain letters, numbers, underscore, hyphen, and dot. "
            "Character ' ' (spaces) is not allowed.");
  EXPECT_EQ(rejected.offendingCharacter.value_or('?'), ' ');
}

TEST_F(ErrorReporterTest, PatternViolationWithUncataloguedCharacter) {
  RejectionDetail detail;
  detail.offendingCharacter = '<';
  auto rejected = ErrorReporter::reject("Name", RejectionSignal::PatternViolation,
                                        rule(FieldKind::Name), detail);

  EXPECT_NE(rejected.reason.find("Character '<' is not allowed."),
            std::string::npos);
}

TEST_F(ErrorReporterTest, NonPrintableOffendingCharacterIsHexEncoded) {
  RejectionDetail detail;
  detail.offendingCharacter = '\0';
  auto rejected = ErrorReporter::reject("Name", RejectionSignal::PatternViolation,
                                        rule(FieldKind::Name), detail);

  EXPECT_NE(rejected.reason.find("Character 0x00 is not allowed."),
            std::string::npos);
}

TEST_F(ErrorReporterTest, MissingValue) {
  auto rejected = ErrorReporter::reject("Name", RejectionSignal::MissingValue,
                                        rule(FieldKind::Name));
  EXPECT_EQ(rejected.reason, "Name cannot be empty.");
  EXPECT_EQ(rejected.errorCode(), ErrorCode::MISSING_VALUE);
}

TEST_F(ErrorReporterTest, LengthViolationUsesRuleBounds) {
  auto rejected = ErrorReporter::reject("Request ID", RejectionSignal::LengthViolation,
                                        rule(FieldKind::Uuid));
  EXPECT_EQ(rejected.reason,
            "Request ID must be between 32 and 36 characters long.");
}

TEST_F(ErrorReporterTest, StartsWithLetterAlsoListsAllowedCharacters) {
  RejectionDetail detail;
  detail.structuralRule = StructuralRule::StartsWithLetter;
  auto rejected =
      ErrorReporter::reject("Tool name", RejectionSignal::StructuralViolation,
                            rule(FieldKind::ToolName), detail);

  EXPECT_EQ(rejected.reason,
            "Tool name must start with a letter. Tool name can only contain "
            "letters, numbers, underscore, hyphen, and dot.");
  EXPECT_EQ(rejected.structuralRule, StructuralRule::StartsWithLetter);
}

TEST_F(ErrorReporterTest, SchemeMessagesListConfiguredSchemes) {
  RejectionDetail detail;
  detail.structuralRule = StructuralRule::SchemeNotAllowed;
  auto uri = ErrorReporter::reject("URI", RejectionSignal::StructuralViolation,
                                   rule(FieldKind::Uri), detail);
  EXPECT_EQ(uri.reason, "URI must use one of the allowed schemes: http, https, "
                        "ws, wss, or file.");

  detail.structuralRule = StructuralRule::SchemeMissing;
  auto url = ErrorReporter::reject("URL", RejectionSignal::StructuralViolation,
                                   rule(FieldKind::Url), detail);
  EXPECT_EQ(url.reason,
            "URL must start with a scheme (http, https, ws, or wss).");
}

TEST_F(ErrorReporterTest, EveryStructuralRuleHasText) {
  const std::vector<StructuralRule> rules = {
      StructuralRule::StartsWithLetter,  StructuralRule::SchemeMissing,
      StructuralRule::SchemeNotAllowed,  StructuralRule::HostMissing,
      StructuralRule::CredentialsPresent, StructuralRule::InvalidPercentEncoding,
      StructuralRule::UuidFormat,        StructuralRule::MimeTypeFormat};

  for (auto structural : rules) {
    RejectionDetail detail;
    detail.structuralRule = structural;
    auto rejected = ErrorReporter::reject(
        "Field", RejectionSignal::StructuralViolation, rule(FieldKind::Url), detail);
    EXPECT_EQ(rejected.reason.rfind("Field ", 0), 0u)
        << structuralRuleToString(structural);
    EXPECT_EQ(rejected.reason.back(), '.') << structuralRuleToString(structural);
  }
}

TEST_F(ErrorReporterTest, UnsafeContentNamesFindingKindsWithoutEchoingValue) {
  RejectionDetail detail;
  detail.findings = {{FindingKind::ScriptTag, 4, 7, "<script"},
                     {FindingKind::HtmlTag, 4, 8, "<script>"},
                     {FindingKind::HtmlTag, 12, 3, "<b>"}};
  auto rejected = ErrorReporter::reject("Name", RejectionSignal::UnsafeContent,
                                        rule(FieldKind::Name), detail);

  EXPECT_EQ(rejected.reason, "Name contains potentially unsafe content "
                             "(script injection and html tag).");
  EXPECT_EQ(rejected.reason.find("<script"), std::string::npos);
  EXPECT_EQ(rejected.findings.size(), 3u);
  EXPECT_EQ(rejected.errorCode(), ErrorCode::UNSAFE_CONTENT);
}

TEST_F(ErrorReporterTest, MessageFollowsRuleClasses) {
  RuleSpec spec = RegistryConfig::defaultRule(FieldKind::Identifier);
  spec.classes.push_back(catalogEntry("colon", ':'));
  RegistryConfig config;
  config.setRule(FieldKind::Identifier, spec);
  PatternRegistry custom(config);

  auto rejected = ErrorReporter::reject("ID", RejectionSignal::PatternViolation,
                                        custom.describe(FieldKind::Identifier));
  EXPECT_EQ(rejected.reason, "ID can only contain letters, numbers, underscore, "
                             "hyphen, dot, and colon.");
}
