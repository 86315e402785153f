#include "fieldguard/secondary_sanitizer.hpp"
#include <gtest/gtest.h>

using namespace fieldguard;

class SecondarySanitizerTest : public ::testing::Test {
protected:
  static bool hasKind(const std::vector<SanitizationFinding> &findings,
                      FindingKind kind) {
    for (const auto &finding : findings) {
      if (finding.kind == kind) {
        return true;
      }
    }
    return false;
  }
};

TEST_F(SecondarySanitizerTest, CleanValuesHaveNoFindings) {
  EXPECT_TRUE(SecondarySanitizer::scan("my_test.name-v1 final").empty());
  EXPECT_TRUE(SecondarySanitizer::scan("https://example.com/a?b=c", true).empty());
  EXPECT_TRUE(SecondarySanitizer::scan("").empty());
  EXPECT_TRUE(SecondarySanitizer::isClean("button"));
  EXPECT_TRUE(SecondarySanitizer::isClean("cron=5"));
}

TEST_F(SecondarySanitizerTest, DetectsHtmlTag) {
  auto findings = SecondarySanitizer::scan("a<b>c");

  ASSERT_EQ(findings.size(), 1u);
  EXPECT_EQ(findings[0].kind, FindingKind::HtmlTag);
  EXPECT_EQ(findings[0].offset, 1u);
  EXPECT_EQ(findings[0].length, 3u);
  EXPECT_EQ(findings[0].matched, "<b>");
}

TEST_F(SecondarySanitizerTest, LoneAngleBracketIsNotATag) {
  EXPECT_TRUE(SecondarySanitizer::isClean("a < b"));
  EXPECT_TRUE(SecondarySanitizer::isClean("a > b"));
}

TEST_F(SecondarySanitizerTest, DetectsScriptTag) {
  auto findings = SecondarySanitizer::scan("name<script>");

  EXPECT_TRUE(hasKind(findings, FindingKind::ScriptTag));
  EXPECT_TRUE(hasKind(findings, FindingKind::HtmlTag));
  ASSERT_FALSE(findings.empty());
  EXPECT_EQ(findings[0].offset, 4u);
}

TEST_F(SecondarySanitizerTest, DetectsClosingScriptTag) {
  EXPECT_TRUE(hasKind(SecondarySanitizer::scan("x</SCRIPT"), FindingKind::ScriptTag));
}

TEST_F(SecondarySanitizerTest, DetectsScriptSchemesCaseInsensitive) {
  EXPECT_TRUE(hasKind(SecondarySanitizer::scan("javascript:alert(1)"),
                      FindingKind::ScriptTag));
  EXPECT_TRUE(hasKind(SecondarySanitizer::scan("JaVaScRiPt:void"),
                      FindingKind::ScriptTag));
  EXPECT_TRUE(hasKind(SecondarySanitizer::scan("vbscript:msgbox"),
                      FindingKind::ScriptTag));
  EXPECT_TRUE(hasKind(SecondarySanitizer::scan("data:text/html,hi"),
                      FindingKind::ScriptTag));
}

TEST_F(SecondarySanitizerTest, DetectsEventHandlers) {
  auto findings = SecondarySanitizer::scan("x onload=run");

  ASSERT_EQ(findings.size(), 1u);
  EXPECT_EQ(findings[0].kind, FindingKind::ScriptTag);
  EXPECT_EQ(findings[0].offset, 2u);
  EXPECT_EQ(findings[0].matched, "onload=");

  EXPECT_TRUE(hasKind(SecondarySanitizer::scan("?OnError=1"), FindingKind::ScriptTag));
  EXPECT_TRUE(hasKind(SecondarySanitizer::scan("onclick =1"), FindingKind::ScriptTag));
}

TEST_F(SecondarySanitizerTest, EventHandlerNeedsWordBoundary) {
  EXPECT_TRUE(SecondarySanitizer::isClean("reasononclick=1"));
  EXPECT_TRUE(SecondarySanitizer::isClean("onload"));
}

TEST_F(SecondarySanitizerTest, DetectsControlCharacters) {
  std::string value("a\0b", 3);
  auto findings = SecondarySanitizer::scan(value);

  ASSERT_EQ(findings.size(), 1u);
  EXPECT_EQ(findings[0].kind, FindingKind::ControlChar);
  EXPECT_EQ(findings[0].offset, 1u);
  EXPECT_EQ(findings[0].length, 1u);

  EXPECT_TRUE(hasKind(SecondarySanitizer::scan("tab\there"), FindingKind::ControlChar));
  EXPECT_TRUE(hasKind(SecondarySanitizer::scan("line\n"), FindingKind::ControlChar));
  EXPECT_TRUE(hasKind(SecondarySanitizer::scan("del\x7F"), FindingKind::ControlChar));
}

TEST_F(SecondarySanitizerTest, TraversalOnlyWhenPathLike) {
  EXPECT_TRUE(SecondarySanitizer::isClean("../etc/passwd", false));
  EXPECT_TRUE(hasKind(SecondarySanitizer::scan("../etc/passwd", true),
                      FindingKind::PathTraversal));
}

TEST_F(SecondarySanitizerTest, TraversalVariants) {
  EXPECT_TRUE(hasKind(SecondarySanitizer::scan("a\\..\\b", true),
                      FindingKind::PathTraversal));
  EXPECT_TRUE(hasKind(SecondarySanitizer::scan("file:///srv/..", true),
                      FindingKind::PathTraversal));
  EXPECT_TRUE(hasKind(SecondarySanitizer::scan("..", true),
                      FindingKind::PathTraversal));
  EXPECT_TRUE(hasKind(SecondarySanitizer::scan("/a/%2E%2e/b", true),
                      FindingKind::PathTraversal));
}

TEST_F(SecondarySanitizerTest, PercentEncodedTraversalVariants) {
  for (const std::string value :
       {"https://example.com/..%2fetc/passwd", "/.%2e/etc/passwd", "/%2e./etc",
        "/..%5cetc", "/%2E%2E%2Fetc", "a%2f..%2fb", "a%5C..", "/%2e%2e"}) {
    auto findings = SecondarySanitizer::scan(value, true);
    EXPECT_TRUE(hasKind(findings, FindingKind::PathTraversal)) << value;
  }
}

TEST_F(SecondarySanitizerTest, TraversalFindingPointsAtDots) {
  auto findings = SecondarySanitizer::scan("/a/..%2fb", true);

  ASSERT_EQ(findings.size(), 1u);
  EXPECT_EQ(findings[0].offset, 3u);
  EXPECT_EQ(findings[0].length, 2u);
  EXPECT_EQ(findings[0].matched, "..");
}

TEST_F(SecondarySanitizerTest, EveryTraversalSegmentIsReported) {
  auto findings = SecondarySanitizer::scan("../../x", true);

  ASSERT_EQ(findings.size(), 2u);
  EXPECT_EQ(findings[0].offset, 0u);
  EXPECT_EQ(findings[1].offset, 3u);
}

TEST_F(SecondarySanitizerTest, DotsInsideSegmentAreNotTraversal) {
  EXPECT_TRUE(SecondarySanitizer::isClean("https://example.com/a..b", true));
  EXPECT_TRUE(SecondarySanitizer::isClean("v1.2.3", true));
  EXPECT_TRUE(SecondarySanitizer::isClean("https://example.com/foo../bar", true));
  EXPECT_TRUE(SecondarySanitizer::isClean("/a%2e%2eb/c", true));
  EXPECT_TRUE(SecondarySanitizer::isClean("/.../x", true));
}

TEST_F(SecondarySanitizerTest, FindingsOrderedByOffset) {
  std::string value = std::string("x\x01") + "<i>/../";
  auto findings = SecondarySanitizer::scan(value, true);

  ASSERT_EQ(findings.size(), 3u);
  EXPECT_EQ(findings[0].kind, FindingKind::ControlChar);
  EXPECT_EQ(findings[1].kind, FindingKind::HtmlTag);
  EXPECT_EQ(findings[2].kind, FindingKind::PathTraversal);
}

TEST_F(SecondarySanitizerTest, ScanIsDeterministic) {
  const std::string value = "<img onerror=x>";
  EXPECT_EQ(SecondarySanitizer::scan(value), SecondarySanitizer::scan(value));
}

TEST_F(SecondarySanitizerTest, FindingKindNames) {
  EXPECT_EQ(findingKindToString(FindingKind::HtmlTag), "html tag");
  EXPECT_EQ(findingKindToString(FindingKind::ScriptTag), "script injection");
  EXPECT_EQ(findingKindToString(FindingKind::PathTraversal), "path traversal");
  EXPECT_EQ(findingKindToString(FindingKind::ControlChar), "control character");
}
