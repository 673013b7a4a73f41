#include "ledgerguard/limits.hpp"
#include "ledgerguard/sanitizer.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace ledgerguard;

class SanitizerTest : public ::testing::Test {
protected:
  static std::string sanitized(std::string_view input) {
    auto outcome = Sanitizer::sanitizeString(input, "field");
    EXPECT_TRUE(outcome.isValid()) << input;
    return outcome.isValid() ? outcome.value() : std::string{};
  }
};

TEST_F(SanitizerTest, EmptyInputIsAccepted) {
  auto outcome = Sanitizer::sanitizeString("", "field");
  ASSERT_TRUE(outcome.isValid());
  EXPECT_EQ(outcome.value(), "");
}

TEST_F(SanitizerTest, LengthCapIsInclusive) {
  std::string atCap(limits::kMaxSanitizedLength, 'a');
  EXPECT_EQ(sanitized(atCap), atCap);

  std::string overCap(limits::kMaxSanitizedLength + 1, 'a');
  auto outcome = Sanitizer::sanitizeString(overCap, "note");
  ASSERT_FALSE(outcome.isValid());
  EXPECT_EQ(outcome.error().code(), ErrorCode::INPUT_TOO_LONG);
  EXPECT_EQ(outcome.error().field(), "note");
  EXPECT_EQ(outcome.error().message(), "input too long");
  EXPECT_EQ(outcome.error().value(), std::string(50, 'a') + "...");
}

TEST_F(SanitizerTest, SqlInjectionIsRejectedBeforeXss) {
  auto outcome =
      Sanitizer::sanitizeString("<script>'; DROP TABLE x</script>", "field");
  ASSERT_FALSE(outcome.isValid());
  EXPECT_EQ(outcome.error().code(), ErrorCode::SQL_INJECTION_DETECTED);
  EXPECT_EQ(outcome.error().message(), "potential SQL injection detected");
}

TEST_F(SanitizerTest, XssIsRejected) {
  auto outcome = Sanitizer::sanitizeString("<script>alert(1)</script>", "field");
  ASSERT_FALSE(outcome.isValid());
  EXPECT_EQ(outcome.error().code(), ErrorCode::XSS_DETECTED);
  EXPECT_EQ(outcome.error().message(), "potential XSS attack detected");
}

TEST_F(SanitizerTest, TrimsAndEncodesHtml) {
  EXPECT_EQ(sanitized("  Tom & Jerry's <b>  "),
            "Tom &amp; Jerry&#39;s &lt;b&gt;");
  EXPECT_EQ(sanitized("say \"hi\""), "say &#34;hi&#34;");
}

TEST_F(SanitizerTest, SanitizingTwiceIsIdempotent) {
  const char *inputs[] = {"  Tom & Jerry's <b>  ", "a < b > c", "\"quoted\"",
                          "plain text", "&amp; already encoded"};
  for (const char *input : inputs) {
    const std::string once = sanitized(input);
    EXPECT_EQ(sanitized(once), once) << input;
  }
}

TEST_F(SanitizerTest, InvalidUtf8IsRejected) {
  auto outcome = Sanitizer::sanitizeString("abc\xff", "field");
  ASSERT_FALSE(outcome.isValid());
  EXPECT_EQ(outcome.error().code(), ErrorCode::INVALID_FORMAT);
  EXPECT_EQ(outcome.error().message(), "invalid UTF-8 encoding");
}

TEST_F(SanitizerTest, TrimSpaceHandlesUnicodeWhitespace) {
  // U+3000 IDEOGRAPHIC SPACE
  EXPECT_EQ(Sanitizer::trimSpace("\xE3\x80\x80hello\t\n"), "hello");
  EXPECT_EQ(Sanitizer::trimSpace("   "), "");
  EXPECT_EQ(Sanitizer::trimSpace("a b"), "a b");
}

TEST_F(SanitizerTest, EscapeHtmlKeepsKnownEntities) {
  EXPECT_EQ(Sanitizer::escapeHtml("a & b"), "a &amp; b");
  EXPECT_EQ(Sanitizer::escapeHtml("&amp;&lt;&gt;&#39;&#34;"),
            "&amp;&lt;&gt;&#39;&#34;");
  EXPECT_EQ(Sanitizer::escapeHtml("&copy;"), "&amp;copy;");
}

TEST_F(SanitizerTest, Utf8Validation) {
  EXPECT_TRUE(Sanitizer::isValidUtf8("caf\xC3\xA9"));
  EXPECT_TRUE(Sanitizer::isValidUtf8(""));
  EXPECT_FALSE(Sanitizer::isValidUtf8("\xC3"));
  EXPECT_FALSE(Sanitizer::isValidUtf8("\xED\xA0\x80")); // surrogate
}
