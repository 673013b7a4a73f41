#pragma once

#include <functional>
#include <string>
#include <type_traits>
#include <unordered_map>

namespace ledgerguard {

// Error codes grouped by category. The validation block is the complete set
// of kinds a ValidationError may carry.
enum class ErrorCode {
  // Validation errors (1000-1999)
  INVALID_INPUT = 1000,          // missing or required value absent
  INPUT_TOO_LONG = 1001,         // length bound exceeded
  INVALID_FORMAT = 1002,         // malformed value, content type, JSON
  INVALID_RANGE = 1003,          // numeric bound violation
  SQL_INJECTION_DETECTED = 1004, // SQL detector matched
  XSS_DETECTED = 1005,           // XSS detector matched
  INVALID_CHARACTERS = 1006,     // failed allow-list pattern

  // Request boundary errors (2000-2999)
  PAYLOAD_TOO_LARGE = 2000,
  RATE_LIMIT_EXCEEDED = 2001,
  UNAUTHORIZED = 2002,
  NOT_FOUND = 2003,
  METHOD_NOT_ALLOWED = 2004,

  // System errors (3000-3999)
  CONFIGURATION_ERROR = 3000,
  NETWORK_ERROR = 3001,
  SERVICE_STARTUP_FAILED = 3002,
  INTERNAL_ERROR = 3003
};

struct ErrorCodeInfo {
  std::string name; // stable wire name, e.g. "SQL_INJECTION_DETECTED"
  std::string description;
  std::string category;
  int defaultHttpStatus;
};

const std::unordered_map<ErrorCode, ErrorCodeInfo> &getErrorCodeInfo();

const char *errorCodeToString(ErrorCode code);
const char *getErrorCodeDescription(ErrorCode code);
int getDefaultHttpStatus(ErrorCode code);
bool isValidationError(ErrorCode code);

} // namespace ledgerguard

namespace std {
template <> struct hash<ledgerguard::ErrorCode> {
  size_t operator()(const ledgerguard::ErrorCode code) const noexcept {
    using Underlying = std::underlying_type_t<ledgerguard::ErrorCode>;
    return std::hash<Underlying>{}(static_cast<Underlying>(code));
  }
};
} // namespace std
