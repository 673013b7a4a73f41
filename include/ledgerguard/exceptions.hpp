#pragma once

#include "ledgerguard/error_codes.hpp"
#include "ledgerguard/string_hash.hpp"
#include <chrono>
#include <exception>
#include <string>

namespace ledgerguard {

using ErrorContext = StringMap<std::string>;

/**
 * @brief Base exception for infrastructure failures (configuration, network,
 * startup).
 *
 * Input validation never throws; it reports through ValidationOutcome.
 */
class LedgerGuardException : public std::exception {
public:
  LedgerGuardException(ErrorCode code, std::string message,
                       ErrorContext context = {});

  LedgerGuardException(const LedgerGuardException &other) = default;
  LedgerGuardException &operator=(const LedgerGuardException &other) = default;
  LedgerGuardException(LedgerGuardException &&other) noexcept = default;
  LedgerGuardException &operator=(LedgerGuardException &&other) noexcept =
      default;

  ~LedgerGuardException() override = default;

  ErrorCode getCode() const { return errorCode_; }
  const std::string &getMessage() const { return message_; }
  const ErrorContext &getContext() const { return context_; }
  const std::string &getCorrelationId() const { return correlationId_; }
  std::chrono::system_clock::time_point getTimestamp() const {
    return timestamp_;
  }

  const char *what() const noexcept override { return message_.c_str(); }

  virtual std::string toLogString() const;

  void addContext(const std::string &key, const std::string &value);

protected:
  ErrorCode errorCode_;
  std::string message_;
  ErrorContext context_;
  std::string correlationId_;
  std::chrono::system_clock::time_point timestamp_;

  static std::string generateCorrelationId();
};

// System exception for infrastructure and system-level errors
class SystemException : public LedgerGuardException {
public:
  SystemException(ErrorCode code, std::string message,
                  std::string component = "", ErrorContext context = {});

  const std::string &getComponent() const { return component_; }

  std::string toLogString() const override;

private:
  std::string component_;
};

} // namespace ledgerguard
