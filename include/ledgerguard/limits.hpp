#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace ledgerguard::limits {

// String lengths are byte lengths of the UTF-8 input.
inline constexpr std::size_t kMaxUsernameLength = 50;
inline constexpr std::size_t kMinUsernamePatternLength = 3;
inline constexpr std::size_t kMinPasswordLength = 8;
inline constexpr std::size_t kMaxPasswordLength = 200;
inline constexpr std::size_t kMaxEmailLength = 254;
inline constexpr std::size_t kMaxNameLength = 100;
inline constexpr std::size_t kMaxDescriptionLength = 500;
inline constexpr std::size_t kMaxCategoryLength = 50;
inline constexpr std::size_t kMaxSanitizedLength = 500;
inline constexpr std::size_t kMaxSessionTokenLength = 128;
inline constexpr std::size_t kMinApiKeyLength = 10;
inline constexpr std::size_t kMaxApiKeyLength = 255;

// Prefix kept when an over-long value is echoed into diagnostics
inline constexpr std::size_t kDiagnosticValuePrefix = 50;

inline constexpr int kMinYear = 1970;
inline constexpr int kMaxYear = 3000;
inline constexpr int kMinMonth = 1;
inline constexpr int kMaxMonth = 12;

inline constexpr std::int64_t kMinAmount = 0;
inline constexpr std::int64_t kMaxAmount =
    std::numeric_limits<std::int64_t>::max();
inline constexpr std::int64_t kMinId = 1;
inline constexpr std::int64_t kMaxId = std::numeric_limits<std::int64_t>::max();

inline constexpr std::size_t kMaxRequestBodyBytes = 1024 * 1024; // 1 MiB

inline constexpr int kDefaultRequestsPerMinute = 60;
inline constexpr std::chrono::seconds kDefaultRateWindow{60};

} // namespace ledgerguard::limits
