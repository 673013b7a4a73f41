#pragma once

#include <charconv>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace ledgerguard {
namespace string_utils {

// ============================================================================
// String View Utilities
// ============================================================================

/**
 * ASCII whitespace trimming without allocation
 */
std::string_view trim_left(std::string_view str) noexcept;
std::string_view trim_right(std::string_view str) noexcept;
std::string_view trim(std::string_view str) noexcept;

bool iequals(std::string_view lhs, std::string_view rhs) noexcept;
bool starts_with(std::string_view str, std::string_view prefix) noexcept;

bool is_whitespace(std::string_view str) noexcept;

// ============================================================================
// Splitting and Case Conversion
// ============================================================================

std::vector<std::string_view> split_view(std::string_view str, char delimiter);

std::string to_lower(std::string_view str);

/**
 * Copy safe to embed in a single log line: control characters become spaces
 * and the result is cut to max_length bytes (ending in "...").
 */
std::string sanitize_for_log(std::string_view str, std::size_t max_length = 200);

// ============================================================================
// Number Conversion
// ============================================================================

template <typename T> struct ConversionResult {
  T value{};
  bool success{false};
  std::string error_message;
};

/**
 * Whole-string integer conversion. Leading or trailing garbage, a leading
 * '+', whitespace and out-of-range values all fail.
 */
template <typename T>
ConversionResult<T> to_integer(std::string_view str) noexcept {
  static_assert(std::is_integral_v<T>, "T must be an integral type");

  ConversionResult<T> result;

  if (str.empty()) {
    result.error_message = "Empty string";
    return result;
  }

  const char *first = str.data();
  const char *last = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(first, last, result.value);

  if (ec == std::errc::result_out_of_range) {
    result.error_message = "Value out of range";
    return result;
  }
  if (ec != std::errc() || ptr != last) {
    result.error_message = "Not an integer";
    return result;
  }

  result.success = true;
  return result;
}

// ============================================================================
// URL Utilities
// ============================================================================

/**
 * Percent-decoding with '+' as space. Malformed escapes are kept verbatim.
 */
std::string url_decode(std::string_view str);

/**
 * Splits "a=1&b=2" into decoded pairs. Later duplicates do not replace
 * earlier keys; callers read the first occurrence.
 */
std::vector<std::pair<std::string, std::string>>
parse_query_string(std::string_view query);

} // namespace string_utils
} // namespace ledgerguard
