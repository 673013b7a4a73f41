#pragma once

#include "ledgerguard/error_codes.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace ledgerguard {

/**
 * @brief A single validation failure.
 *
 * Carries the offending field, a representation of the value (redacted for
 * secrets, truncated when long), a human readable message and the kind of
 * failure. Immutable once built.
 */
class ValidationError {
public:
  // Placeholder stored instead of passwords, tokens and keys
  static constexpr std::string_view kRedacted = "[hidden]";

  ValidationError(std::string field, std::string value, std::string message,
                  ErrorCode code);

  const std::string &field() const { return field_; }
  const std::string &value() const { return value_; }
  const std::string &message() const { return message_; }
  ErrorCode code() const { return code_; }

  // "<field>: <message>"
  std::string describe() const;

  // Operator-facing representation, includes the stored value
  std::string toLogString() const;

  bool operator==(const ValidationError &other) const;

  // Keeps the first bytes of an over-long value followed by "..."
  static std::string truncateValue(std::string_view value);

private:
  std::string field_;
  std::string value_;
  std::string message_;
  ErrorCode code_;
};

/**
 * @brief Either a fully validated value or the error that stopped validation.
 *
 * A failed outcome holds no value at all, so callers cannot read a partially
 * validated result.
 */
template <typename T> class ValidationOutcome {
public:
  static ValidationOutcome success(T value) {
    return ValidationOutcome(std::in_place_index<0>, std::move(value));
  }

  static ValidationOutcome failure(ValidationError error) {
    return ValidationOutcome(std::in_place_index<1>, std::move(error));
  }

  // Implicit conversion from an error keeps early returns terse
  ValidationOutcome(ValidationError error)
      : state_(std::in_place_index<1>, std::move(error)) {}

  bool isValid() const { return state_.index() == 0; }
  explicit operator bool() const { return isValid(); }

  // Throws std::bad_variant_access when called on a failed outcome
  const T &value() const & { return std::get<0>(state_); }
  T &&value() && { return std::get<0>(std::move(state_)); }

  const ValidationError &error() const { return std::get<1>(state_); }

  std::optional<ValidationError> errorOrNone() const {
    if (isValid()) {
      return std::nullopt;
    }
    return error();
  }

private:
  template <std::size_t Index, typename Arg>
  ValidationOutcome(std::in_place_index_t<Index> tag, Arg &&arg)
      : state_(tag, std::forward<Arg>(arg)) {}

  std::variant<T, ValidationError> state_;
};

// Result of a check that produces no value
using ValidationCheck = std::optional<ValidationError>;

} // namespace ledgerguard
