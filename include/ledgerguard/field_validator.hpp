#pragma once

#include "ledgerguard/validation_error.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace ledgerguard {

/**
 * @brief Per-field validation and sanitization.
 *
 * String validators apply, in order: required check, byte-length bound,
 * SQL/XSS screening of the raw value, the field's character allow-list and
 * finally Sanitizer::sanitizeString. The first failure is returned; a
 * successful outcome carries the sanitized value.
 *
 * Numeric validators only check inclusive ranges.
 */
class FieldValidator {
public:
  static ValidationOutcome<std::string> validateUsername(std::string_view username);

  // Never sanitized; errors always carry the redacted value
  static ValidationCheck validatePassword(std::string_view password);

  // Optional: empty input yields an empty result
  static ValidationOutcome<std::string> validateEmail(std::string_view email);

  static ValidationOutcome<std::string> validateName(std::string_view name,
                                                     std::string_view fieldName);

  static ValidationOutcome<std::string>
  validateDescription(std::string_view description);

  // Optional: empty input yields an empty result
  static ValidationOutcome<std::string> validateCategory(std::string_view category);

  static ValidationCheck validateYearMonth(std::int64_t year,
                                           std::int64_t month);

  static ValidationCheck validateAmount(std::int64_t amount,
                                        std::string_view fieldName);

  static ValidationCheck validateUserId(std::int64_t userId);

  static ValidationCheck validateId(std::int64_t id, std::string_view fieldName);

  static ValidationOutcome<std::string> validateUserStatus(std::string_view status);

  static ValidationCheck validateSessionToken(std::string_view token);

  static ValidationCheck validateApiKey(std::string_view apiKey);

private:
  static ValidationCheck screenForInjection(std::string_view value,
                                            std::string_view fieldName);
};

} // namespace ledgerguard
