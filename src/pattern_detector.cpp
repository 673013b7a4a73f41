#include "ledgerguard/pattern_detector.hpp"
#include "ledgerguard/string_utils.hpp"
#include <algorithm>
#include <string>
#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace ledgerguard {

namespace {

// Simple per-code-point lower case mapping, so U+212A (Kelvin sign) folds to
// 'k'. Ill-formed UTF-8 bytes are copied through unchanged.
std::string foldCase(std::string_view input) {
  const bool ascii = std::all_of(input.begin(), input.end(), [](char c) {
    return static_cast<unsigned char>(c) < 0x80;
  });
  if (ascii) {
    return string_utils::to_lower(input);
  }

  std::string folded;
  folded.reserve(input.size());

  const auto *bytes = reinterpret_cast<const uint8_t *>(input.data());
  const auto length = static_cast<int32_t>(input.size());
  int32_t offset = 0;
  while (offset < length) {
    const int32_t start = offset;
    UChar32 cp;
    U8_NEXT(bytes, offset, length, cp);
    if (cp < 0) {
      folded.append(input.substr(start, offset - start));
      continue;
    }

    const UChar32 lower = u_tolower(cp);
    uint8_t buffer[U8_MAX_LENGTH];
    int32_t written = 0;
    U8_APPEND_UNSAFE(buffer, written, lower);
    folded.append(reinterpret_cast<const char *>(buffer), written);
  }
  return folded;
}

template <typename Patterns>
bool containsAny(std::string_view input, const Patterns &list) {
  if (input.empty()) {
    return false;
  }
  const std::string lowered = foldCase(input);
  return std::any_of(list.begin(), list.end(),
                     [&lowered](std::string_view pattern) {
                       return lowered.find(pattern) != std::string::npos;
                     });
}

} // namespace

bool PatternDetector::containsSqlInjection(std::string_view input) {
  return containsAny(input, patterns::kSqlInjection);
}

bool PatternDetector::containsXss(std::string_view input) {
  return containsAny(input, patterns::kXss);
}

bool PatternDetector::isSuspicious(std::string_view input) {
  return containsSqlInjection(input) || containsXss(input);
}

} // namespace ledgerguard
