#pragma once

#include "ledgerguard/domain_models.hpp"
#include "ledgerguard/validation_error.hpp"
#include <utility>
#include <vector>

namespace ledgerguard {

class RequestValidator;

/**
 * @brief A payload that passed its request validator.
 *
 * Only RequestValidator can construct one, so a handler holding a
 * Validated<T> knows every field was checked and every string sanitized.
 */
template <typename T> class Validated {
public:
  const T &get() const & { return value_; }
  T take() && { return std::move(value_); }

  const T &operator*() const & { return value_; }
  const T *operator->() const { return &value_; }

private:
  friend class RequestValidator;

  explicit Validated(T value) : value_(std::move(value)) {}

  T value_;
};

/**
 * @brief Whole-payload validators, one per API shape.
 *
 * Each validator walks the fields top to bottom, stops at the first failing
 * field and returns that error unchanged. On success the result is rebuilt
 * from validated outputs only; the input is never modified.
 */
class RequestValidator {
public:
  template <typename T> using Result = ValidationOutcome<Validated<T>>;

  // name -> year/month -> amount_cents
  static Result<CreateIncomeSourceRequest>
  validateCreateIncomeSource(const CreateIncomeSourceRequest &request);

  static Result<CreateBudgetSourceRequest>
  validateCreateBudgetSource(const CreateBudgetSourceRequest &request);

  // name -> amount_cents
  static Result<UpdateSourceRequest>
  validateUpdateSource(const UpdateSourceRequest &request);

  // year/month -> category -> description -> amount_cents
  static Result<ExpenseRequest> validateExpense(const ExpenseRequest &request);

  // items[i].name -> items[i].amount_cents, then items[i].id when present
  static Result<std::vector<ManualBudgetItem>>
  validateManualBudgetItems(const std::vector<ManualBudgetItem> &items);

  // year/month -> bank_amount_cents -> items
  static Result<ManualBudgetRequest>
  validateManualBudget(const ManualBudgetRequest &request);

  // username -> password; the password is passed through untouched
  static Result<LoginRequest> validateLogin(const LoginRequest &request);

private:
  template <typename T> static Result<T> accept(T value) {
    return Result<T>::success(Validated<T>(std::move(value)));
  }

  static ValidationOutcome<std::vector<ManualBudgetItem>>
  checkItems(const std::vector<ManualBudgetItem> &items);
};

} // namespace ledgerguard
