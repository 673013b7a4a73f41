#include "ledgerguard/sanitizer.hpp"
#include "ledgerguard/limits.hpp"
#include "ledgerguard/pattern_detector.hpp"
#include <unicode/uchar.h>
#include <unicode/utf8.h>
#include <algorithm>
#include <array>
#include <cstdint>

namespace ledgerguard {

namespace {

using namespace std::string_view_literals;

constexpr std::array kKnownEntities = {"&amp;"sv, "&lt;"sv, "&gt;"sv,
                                       "&#39;"sv, "&#34;"sv};

bool startsWithKnownEntity(std::string_view text) {
  return std::any_of(kKnownEntities.begin(), kKnownEntities.end(),
                     [text](std::string_view entity) {
                       return text.substr(0, entity.size()) == entity;
                     });
}

} // namespace

ValidationOutcome<std::string>
Sanitizer::sanitizeString(std::string_view input, std::string_view field) {
  if (input.empty()) {
    return ValidationOutcome<std::string>::success(std::string{});
  }

  if (input.size() > limits::kMaxSanitizedLength) {
    return ValidationError(std::string(field),
                           ValidationError::truncateValue(input),
                           "input too long", ErrorCode::INPUT_TOO_LONG);
  }

  if (PatternDetector::containsSqlInjection(input)) {
    return ValidationError(std::string(field),
                           ValidationError::truncateValue(input),
                           "potential SQL injection detected",
                           ErrorCode::SQL_INJECTION_DETECTED);
  }

  if (PatternDetector::containsXss(input)) {
    return ValidationError(std::string(field),
                           ValidationError::truncateValue(input),
                           "potential XSS attack detected",
                           ErrorCode::XSS_DETECTED);
  }

  std::string sanitized = escapeHtml(trimSpace(input));

  if (!isValidUtf8(sanitized)) {
    return ValidationError(std::string(field),
                           ValidationError::truncateValue(input),
                           "invalid UTF-8 encoding", ErrorCode::INVALID_FORMAT);
  }

  return ValidationOutcome<std::string>::success(std::move(sanitized));
}

std::string Sanitizer::escapeHtml(std::string_view input) {
  std::string result;
  result.reserve(input.size() + input.size() / 8);

  for (std::size_t i = 0; i < input.size(); ++i) {
    const char c = input[i];
    switch (c) {
    case '&':
      if (startsWithKnownEntity(input.substr(i))) {
        result += c;
      } else {
        result += "&amp;";
      }
      break;
    case '<':
      result += "&lt;";
      break;
    case '>':
      result += "&gt;";
      break;
    case '\'':
      result += "&#39;";
      break;
    case '"':
      result += "&#34;";
      break;
    default:
      result += c;
    }
  }

  return result;
}

std::string Sanitizer::trimSpace(std::string_view input) {
  const auto *bytes = reinterpret_cast<const uint8_t *>(input.data());
  const auto length = static_cast<int32_t>(input.size());

  int32_t begin = 0;
  while (begin < length) {
    int32_t next = begin;
    UChar32 cp;
    U8_NEXT(bytes, next, length, cp);
    if (cp < 0 || !u_isUWhiteSpace(cp)) {
      break;
    }
    begin = next;
  }

  int32_t end = length;
  while (end > begin) {
    int32_t prev = end;
    UChar32 cp;
    U8_PREV(bytes, begin, prev, cp);
    if (cp < 0 || !u_isUWhiteSpace(cp)) {
      break;
    }
    end = prev;
  }

  return std::string(input.substr(static_cast<std::size_t>(begin),
                                  static_cast<std::size_t>(end - begin)));
}

bool Sanitizer::isValidUtf8(std::string_view input) {
  const auto *bytes = reinterpret_cast<const uint8_t *>(input.data());
  const auto length = static_cast<int32_t>(input.size());

  int32_t offset = 0;
  while (offset < length) {
    UChar32 cp;
    U8_NEXT(bytes, offset, length, cp);
    if (cp < 0) {
      return false;
    }
  }
  return true;
}

} // namespace ledgerguard
