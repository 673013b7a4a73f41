#include "ledgerguard/field_validator.hpp"
#include "ledgerguard/limits.hpp"
#include "ledgerguard/pattern_detector.hpp"
#include "ledgerguard/sanitizer.hpp"
#include <unicode/uchar.h>
#include <unicode/utf8.h>
#include <cstdint>
#include <regex>

namespace ledgerguard {

namespace {

// Allow-lists. Whitespace is spelled out as [ \t\n\f\r]. Upper length
// bounds are checked before matching, so only username keeps a quantifier.
const std::regex &usernamePattern() {
  static const std::regex pattern("^[A-Za-z0-9_.\\-]{3,50}$");
  return pattern;
}

const std::regex &emailPattern() {
  static const std::regex pattern(
      "^[A-Za-z0-9._%+\\-]+@[A-Za-z0-9.\\-]+\\.[A-Za-z]{2,}$");
  return pattern;
}

const std::regex &namePattern() {
  static const std::regex pattern("^[A-Za-z0-9 \\t\\n\\f\\r_.()\\-]+$");
  return pattern;
}

const std::regex &descriptionPattern() {
  static const std::regex pattern(
      "^[A-Za-z0-9 \\t\\n\\f\\r_.,!?()\\[\\]\\-]+$");
  return pattern;
}

const std::regex &categoryPattern() {
  static const std::regex pattern("^[A-Za-z0-9 \\t\\n\\f\\r_\\-]*$");
  return pattern;
}

bool matches(std::string_view value, const std::regex &pattern) {
  return std::regex_match(value.begin(), value.end(), pattern);
}

std::string tooLongMessage(std::string_view kind, std::size_t max) {
  return std::string(kind) + " too long (max " + std::to_string(max) +
         " chars)";
}

struct CharacterClasses {
  bool lower = false;
  bool upper = false;
  bool digit = false;
  bool special = false;
};

// Caller guarantees valid UTF-8
CharacterClasses classifyCharacters(std::string_view text) {
  CharacterClasses classes;
  const auto *bytes = reinterpret_cast<const uint8_t *>(text.data());
  const auto length = static_cast<int32_t>(text.size());

  int32_t offset = 0;
  while (offset < length) {
    UChar32 cp;
    U8_NEXT(bytes, offset, length, cp);
    const uint32_t mask = U_GET_GC_MASK(cp);
    if (mask & U_GC_LL_MASK) {
      classes.lower = true;
    } else if (mask & U_GC_LU_MASK) {
      classes.upper = true;
    } else if (mask & U_GC_ND_MASK) {
      classes.digit = true;
    } else if (mask & (U_GC_P_MASK | U_GC_S_MASK)) {
      classes.special = true;
    }
  }
  return classes;
}

} // namespace

ValidationCheck FieldValidator::screenForInjection(std::string_view value,
                                                   std::string_view fieldName) {
  if (PatternDetector::containsSqlInjection(value)) {
    return ValidationError(std::string(fieldName),
                           ValidationError::truncateValue(value),
                           "potential SQL injection detected",
                           ErrorCode::SQL_INJECTION_DETECTED);
  }
  if (PatternDetector::containsXss(value)) {
    return ValidationError(std::string(fieldName),
                           ValidationError::truncateValue(value),
                           "potential XSS attack detected",
                           ErrorCode::XSS_DETECTED);
  }
  return std::nullopt;
}

ValidationOutcome<std::string>
FieldValidator::validateUsername(std::string_view username) {
  const std::string field = "username";

  if (username.empty()) {
    return ValidationError(field, "", "username is required",
                           ErrorCode::INVALID_INPUT);
  }
  if (username.size() > limits::kMaxUsernameLength) {
    return ValidationError(field, ValidationError::truncateValue(username),
                           tooLongMessage("username", limits::kMaxUsernameLength),
                           ErrorCode::INPUT_TOO_LONG);
  }
  if (auto error = screenForInjection(username, field)) {
    return *error;
  }
  if (!matches(username, usernamePattern())) {
    return ValidationError(field, std::string(username),
                           "username contains invalid characters (use only "
                           "letters, numbers, underscore, hyphen, dot)",
                           ErrorCode::INVALID_CHARACTERS);
  }
  return Sanitizer::sanitizeString(username, field);
}

ValidationCheck FieldValidator::validatePassword(std::string_view password) {
  const std::string field = "password";
  const std::string hidden(ValidationError::kRedacted);

  if (password.empty()) {
    return ValidationError(field, hidden, "password is required",
                           ErrorCode::INVALID_INPUT);
  }
  if (password.size() < limits::kMinPasswordLength) {
    return ValidationError(field, hidden,
                           "password must be at least 8 characters long",
                           ErrorCode::INVALID_INPUT);
  }
  if (password.size() > limits::kMaxPasswordLength) {
    return ValidationError(field, hidden,
                           tooLongMessage("password", limits::kMaxPasswordLength),
                           ErrorCode::INPUT_TOO_LONG);
  }
  if (!Sanitizer::isValidUtf8(password)) {
    return ValidationError(field, hidden, "password contains invalid characters",
                           ErrorCode::INVALID_FORMAT);
  }

  const auto classes = classifyCharacters(password);
  if (!classes.lower || !classes.upper || !classes.digit || !classes.special) {
    return ValidationError(field, hidden,
                           "password must contain at least one lowercase "
                           "letter, uppercase letter, digit, and special "
                           "character",
                           ErrorCode::INVALID_INPUT);
  }
  return std::nullopt;
}

ValidationOutcome<std::string>
FieldValidator::validateEmail(std::string_view email) {
  const std::string field = "email";

  if (email.empty()) {
    return ValidationOutcome<std::string>::success(std::string{});
  }
  if (email.size() > limits::kMaxEmailLength) {
    return ValidationError(field, ValidationError::truncateValue(email),
                           tooLongMessage("email", limits::kMaxEmailLength),
                           ErrorCode::INPUT_TOO_LONG);
  }
  if (auto error = screenForInjection(email, field)) {
    return *error;
  }
  if (!matches(email, emailPattern())) {
    return ValidationError(field, std::string(email), "invalid email format",
                           ErrorCode::INVALID_FORMAT);
  }
  return Sanitizer::sanitizeString(email, field);
}

ValidationOutcome<std::string>
FieldValidator::validateName(std::string_view name, std::string_view fieldName) {
  const std::string field(fieldName);

  if (name.empty()) {
    return ValidationError(field, "", "name is required",
                           ErrorCode::INVALID_INPUT);
  }
  if (name.size() > limits::kMaxNameLength) {
    return ValidationError(field, ValidationError::truncateValue(name),
                           tooLongMessage("name", limits::kMaxNameLength),
                           ErrorCode::INPUT_TOO_LONG);
  }
  if (auto error = screenForInjection(name, field)) {
    return *error;
  }
  if (!matches(name, namePattern())) {
    return ValidationError(field, std::string(name),
                           "name contains invalid characters",
                           ErrorCode::INVALID_CHARACTERS);
  }
  return Sanitizer::sanitizeString(name, field);
}

ValidationOutcome<std::string>
FieldValidator::validateDescription(std::string_view description) {
  const std::string field = "description";

  if (description.empty()) {
    return ValidationError(field, "", "description is required",
                           ErrorCode::INVALID_INPUT);
  }
  if (description.size() > limits::kMaxDescriptionLength) {
    return ValidationError(field, ValidationError::truncateValue(description),
                           tooLongMessage("description",
                                          limits::kMaxDescriptionLength),
                           ErrorCode::INPUT_TOO_LONG);
  }
  if (auto error = screenForInjection(description, field)) {
    return *error;
  }
  if (!matches(description, descriptionPattern())) {
    return ValidationError(field, ValidationError::truncateValue(description),
                           "description contains invalid characters",
                           ErrorCode::INVALID_CHARACTERS);
  }
  return Sanitizer::sanitizeString(description, field);
}

ValidationOutcome<std::string>
FieldValidator::validateCategory(std::string_view category) {
  const std::string field = "category";

  if (category.empty()) {
    return ValidationOutcome<std::string>::success(std::string{});
  }
  if (category.size() > limits::kMaxCategoryLength) {
    return ValidationError(field, ValidationError::truncateValue(category),
                           tooLongMessage("category", limits::kMaxCategoryLength),
                           ErrorCode::INPUT_TOO_LONG);
  }
  if (auto error = screenForInjection(category, field)) {
    return *error;
  }
  if (!matches(category, categoryPattern())) {
    return ValidationError(field, std::string(category),
                           "category contains invalid characters",
                           ErrorCode::INVALID_CHARACTERS);
  }
  return Sanitizer::sanitizeString(category, field);
}

ValidationCheck FieldValidator::validateYearMonth(std::int64_t year,
                                                  std::int64_t month) {
  if (year < limits::kMinYear || year > limits::kMaxYear) {
    return ValidationError("year", std::to_string(year),
                           "year must be between " +
                               std::to_string(limits::kMinYear) + " and " +
                               std::to_string(limits::kMaxYear),
                           ErrorCode::INVALID_RANGE);
  }
  if (month < limits::kMinMonth || month > limits::kMaxMonth) {
    return ValidationError("month", std::to_string(month),
                           "month must be between " +
                               std::to_string(limits::kMinMonth) + " and " +
                               std::to_string(limits::kMaxMonth),
                           ErrorCode::INVALID_RANGE);
  }
  return std::nullopt;
}

ValidationCheck FieldValidator::validateAmount(std::int64_t amount,
                                               std::string_view fieldName) {
  // kMaxAmount is INT64_MAX, so only the lower bound can fail for int64 input
  if (amount < limits::kMinAmount) {
    return ValidationError(std::string(fieldName), std::to_string(amount),
                           "amount must be at least " +
                               std::to_string(limits::kMinAmount),
                           ErrorCode::INVALID_RANGE);
  }
  return std::nullopt;
}

ValidationCheck FieldValidator::validateUserId(std::int64_t userId) {
  if (userId < limits::kMinId) {
    return ValidationError("user_id", std::to_string(userId), "invalid user ID",
                           ErrorCode::INVALID_RANGE);
  }
  return std::nullopt;
}

ValidationCheck FieldValidator::validateId(std::int64_t id,
                                           std::string_view fieldName) {
  if (id < limits::kMinId) {
    return ValidationError(std::string(fieldName), std::to_string(id),
                           "invalid ID value", ErrorCode::INVALID_RANGE);
  }
  return std::nullopt;
}

ValidationOutcome<std::string>
FieldValidator::validateUserStatus(std::string_view status) {
  if (status != "pending" && status != "approved" && status != "rejected") {
    return ValidationError("status", ValidationError::truncateValue(status),
                           "status must be one of: pending, approved, rejected",
                           ErrorCode::INVALID_INPUT);
  }
  return ValidationOutcome<std::string>::success(std::string(status));
}

ValidationCheck FieldValidator::validateSessionToken(std::string_view token) {
  const std::string field = "session_token";
  const std::string hidden(ValidationError::kRedacted);

  if (token.empty()) {
    return ValidationError(field, "", "session token is required",
                           ErrorCode::INVALID_INPUT);
  }
  if (token.size() > limits::kMaxSessionTokenLength) {
    return ValidationError(field, hidden, "session token too long",
                           ErrorCode::INPUT_TOO_LONG);
  }
  if (PatternDetector::isSuspicious(token)) {
    return ValidationError(field, hidden, "invalid session token format",
                           ErrorCode::INVALID_FORMAT);
  }
  return std::nullopt;
}

ValidationCheck FieldValidator::validateApiKey(std::string_view apiKey) {
  const std::string field = "api_key";
  const std::string hidden(ValidationError::kRedacted);

  if (apiKey.empty()) {
    return ValidationError(field, "", "API key is required",
                           ErrorCode::INVALID_INPUT);
  }
  if (apiKey.size() < limits::kMinApiKeyLength ||
      apiKey.size() > limits::kMaxApiKeyLength) {
    return ValidationError(field, hidden, "API key length invalid",
                           ErrorCode::INVALID_FORMAT);
  }
  if (PatternDetector::isSuspicious(apiKey)) {
    return ValidationError(field, hidden, "invalid API key format",
                           ErrorCode::INVALID_FORMAT);
  }
  return std::nullopt;
}

} // namespace ledgerguard
