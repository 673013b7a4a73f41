#include "ledgerguard/pattern_detector.hpp"
#include <algorithm>
#include <cctype>
#include <gtest/gtest.h>
#include <string>

using namespace ledgerguard;

class PatternDetectorTest : public ::testing::Test {
protected:
  static std::string upper(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
  }

  static std::string embed(std::string_view pattern) {
    return "prefix " + upper(pattern) + " suffix";
  }
};

TEST_F(PatternDetectorTest, EverySqlPatternIsDetectedCaseInsensitively) {
  for (auto pattern : patterns::kSqlInjection) {
    EXPECT_TRUE(PatternDetector::containsSqlInjection(embed(pattern)))
        << "pattern not detected: " << pattern;
  }
}

TEST_F(PatternDetectorTest, EveryXssPatternIsDetectedCaseInsensitively) {
  for (auto pattern : patterns::kXss) {
    EXPECT_TRUE(PatternDetector::containsXss(embed(pattern)))
        << "pattern not detected: " << pattern;
  }
}

TEST_F(PatternDetectorTest, PatternListsAreLowerCase) {
  for (auto pattern : patterns::kSqlInjection) {
    for (char c : pattern) {
      EXPECT_FALSE(std::isupper(static_cast<unsigned char>(c))) << pattern;
    }
  }
  for (auto pattern : patterns::kXss) {
    for (char c : pattern) {
      EXPECT_FALSE(std::isupper(static_cast<unsigned char>(c))) << pattern;
    }
  }
}

TEST_F(PatternDetectorTest, CleanCorpusIsNotFlagged) {
  const char *clean[] = {"Salary",
                         "Rent for March",
                         "Birthday present for mom",
                         "john_doe",
                         "Electric bill.",
                         "Savings account (joint)",
                         "Groceries, fruit and bread!",
                         "alice@example.com",
                         "Mozilla/5.0 (X11; Linux x86_64) Firefox/118.0",
                         "https://example.com/budget?year=2024"};

  for (const char *text : clean) {
    EXPECT_FALSE(PatternDetector::containsSqlInjection(text)) << text;
    EXPECT_FALSE(PatternDetector::containsXss(text)) << text;
    EXPECT_FALSE(PatternDetector::isSuspicious(text)) << text;
  }
}

TEST_F(PatternDetectorTest, TypicalAttackStrings) {
  EXPECT_TRUE(PatternDetector::containsSqlInjection(
      "admin'; DROP TABLE users; --"));
  EXPECT_TRUE(PatternDetector::containsSqlInjection("1 UNION SELECT password"));
  EXPECT_TRUE(PatternDetector::containsSqlInjection("x' OR 1=1"));
  EXPECT_TRUE(PatternDetector::containsXss("<script>alert(1)</script>"));
  EXPECT_TRUE(PatternDetector::containsXss("<IMG ONERROR=x>"));
  EXPECT_TRUE(PatternDetector::containsXss("JavaScript:void(0)"));
}

TEST_F(PatternDetectorTest, SuspiciousCombinesBothDetectors) {
  EXPECT_TRUE(PatternDetector::isSuspicious("DELETE FROM budgets"));
  EXPECT_TRUE(PatternDetector::isSuspicious("onclick=steal()"));
  EXPECT_FALSE(PatternDetector::isSuspicious(""));
}

TEST_F(PatternDetectorTest, NonAsciiCaseVariantsAreFolded) {
  // U+212A KELVIN SIGN lower-cases to 'k'
  EXPECT_TRUE(PatternDetector::containsXss("ONCLIC\xE2\x84\xAA=steal()"));
  EXPECT_TRUE(PatternDetector::containsSqlInjection("BENCHMAR\xE2\x84\xAA(1,1)"));
  // U+0130 LATIN CAPITAL LETTER I WITH DOT ABOVE lower-cases to 'i'
  EXPECT_TRUE(PatternDetector::containsXss("<\xC4\xB0" "FRAME src=x>"));

  EXPECT_FALSE(PatternDetector::isSuspicious("Caf\xC3\x89 Br\xC3\xBC" "cke"));
}

TEST_F(PatternDetectorTest, IllFormedUtf8IsMatchedBytewise) {
  EXPECT_TRUE(PatternDetector::containsXss("\xFF<SCRIPT>"));
  EXPECT_FALSE(PatternDetector::containsXss("<scr\xFFipt>"));
}
