#include "ledgerguard/string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace ledgerguard {
namespace string_utils {

// ============================================================================
// String View Utilities Implementation
// ============================================================================

std::string_view trim_left(std::string_view str) noexcept {
  auto start = str.find_first_not_of(" \t\n\r\f\v");
  return start == std::string_view::npos ? std::string_view{}
                                         : str.substr(start);
}

std::string_view trim_right(std::string_view str) noexcept {
  auto end = str.find_last_not_of(" \t\n\r\f\v");
  return end == std::string_view::npos ? std::string_view{}
                                       : str.substr(0, end + 1);
}

std::string_view trim(std::string_view str) noexcept {
  return trim_left(trim_right(str));
}

bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  return std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
  });
}

bool starts_with(std::string_view str, std::string_view prefix) noexcept {
  return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix;
}

bool is_whitespace(std::string_view str) noexcept {
  return std::all_of(str.begin(), str.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c));
  });
}

// ============================================================================
// Splitting and Case Conversion Implementation
// ============================================================================

std::vector<std::string_view> split_view(std::string_view str,
                                         char delimiter) {
  std::vector<std::string_view> parts;
  std::size_t start = 0;

  while (true) {
    auto pos = str.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.push_back(str.substr(start));
      break;
    }
    parts.push_back(str.substr(start, pos - start));
    start = pos + 1;
  }

  return parts;
}

std::string to_lower(std::string_view str) {
  std::string result;
  result.reserve(str.size());

  std::transform(
      str.begin(), str.end(), std::back_inserter(result),
      [](char c) { return std::tolower(static_cast<unsigned char>(c)); });

  return result;
}

std::string sanitize_for_log(std::string_view str, std::size_t max_length) {
  std::string result(str.substr(0, std::min(str.size(), max_length)));

  for (char &c : result) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc < 0x20 || uc == 0x7f) {
      c = ' ';
    }
  }

  if (str.size() > max_length && max_length >= 3) {
    result.replace(max_length - 3, 3, "...");
  }
  return result;
}

// ============================================================================
// URL Utilities Implementation
// ============================================================================

namespace {

int hex_value(char c) noexcept {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

std::string url_decode(std::string_view str) {
  std::string decoded;
  decoded.reserve(str.size());

  for (std::size_t i = 0; i < str.size(); ++i) {
    if (str[i] == '%' && i + 2 < str.size()) {
      int high = hex_value(str[i + 1]);
      int low = hex_value(str[i + 2]);
      if (high >= 0 && low >= 0) {
        decoded.push_back(static_cast<char>((high << 4) | low));
        i += 2;
      } else {
        decoded.push_back(str[i]); // Invalid encoding, keep as-is
      }
    } else if (str[i] == '+') {
      decoded.push_back(' ');
    } else {
      decoded.push_back(str[i]);
    }
  }

  return decoded;
}

std::vector<std::pair<std::string, std::string>>
parse_query_string(std::string_view query) {
  std::vector<std::pair<std::string, std::string>> params;
  if (query.empty()) {
    return params;
  }

  for (auto pair : split_view(query, '&')) {
    if (pair.empty()) {
      continue;
    }
    auto eq = pair.find('=');
    if (eq == std::string_view::npos) {
      params.emplace_back(url_decode(pair), std::string{});
    } else {
      params.emplace_back(url_decode(pair.substr(0, eq)),
                          url_decode(pair.substr(eq + 1)));
    }
  }

  return params;
}

} // namespace string_utils
} // namespace ledgerguard
