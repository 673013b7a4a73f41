#include "ledgerguard/request_validator.hpp"
#include "ledgerguard/field_validator.hpp"
#include "ledgerguard/logger.hpp"
#include <string>

namespace ledgerguard {

namespace {

std::string itemField(std::size_t index, const char *name) {
  return "items[" + std::to_string(index) + "]." + name;
}

template <typename Source>
ValidationOutcome<Source> validateCreateSource(const Source &request) {
  auto name = FieldValidator::validateName(request.name, "name");
  if (!name) {
    return name.error();
  }
  if (auto error = FieldValidator::validateYearMonth(request.year, request.month)) {
    return *error;
  }
  if (auto error =
          FieldValidator::validateAmount(request.amount_cents, "amount_cents")) {
    return *error;
  }

  Source validated;
  validated.name = std::move(name).value();
  validated.year = request.year;
  validated.month = request.month;
  validated.amount_cents = request.amount_cents;
  return ValidationOutcome<Source>::success(std::move(validated));
}

} // namespace

RequestValidator::Result<CreateIncomeSourceRequest>
RequestValidator::validateCreateIncomeSource(
    const CreateIncomeSourceRequest &request) {
  auto outcome = validateCreateSource(request);
  if (!outcome) {
    return outcome.error();
  }
  return accept(std::move(outcome).value());
}

RequestValidator::Result<CreateBudgetSourceRequest>
RequestValidator::validateCreateBudgetSource(
    const CreateBudgetSourceRequest &request) {
  auto outcome = validateCreateSource(request);
  if (!outcome) {
    return outcome.error();
  }
  return accept(std::move(outcome).value());
}

RequestValidator::Result<UpdateSourceRequest>
RequestValidator::validateUpdateSource(const UpdateSourceRequest &request) {
  auto name = FieldValidator::validateName(request.name, "name");
  if (!name) {
    return name.error();
  }
  if (auto error =
          FieldValidator::validateAmount(request.amount_cents, "amount_cents")) {
    return *error;
  }

  UpdateSourceRequest validated;
  validated.name = std::move(name).value();
  validated.amount_cents = request.amount_cents;
  return accept(std::move(validated));
}

RequestValidator::Result<ExpenseRequest>
RequestValidator::validateExpense(const ExpenseRequest &request) {
  if (auto error = FieldValidator::validateYearMonth(request.year, request.month)) {
    return *error;
  }
  auto category = FieldValidator::validateCategory(request.category);
  if (!category) {
    return category.error();
  }
  auto description = FieldValidator::validateDescription(request.description);
  if (!description) {
    return description.error();
  }
  if (auto error =
          FieldValidator::validateAmount(request.amount_cents, "amount_cents")) {
    return *error;
  }

  ExpenseRequest validated;
  validated.year = request.year;
  validated.month = request.month;
  validated.category = std::move(category).value();
  validated.description = std::move(description).value();
  validated.amount_cents = request.amount_cents;
  return accept(std::move(validated));
}

ValidationOutcome<std::vector<ManualBudgetItem>>
RequestValidator::checkItems(const std::vector<ManualBudgetItem> &items) {
  std::vector<ManualBudgetItem> validated;
  validated.reserve(items.size());

  for (std::size_t i = 0; i < items.size(); ++i) {
    const auto &item = items[i];

    auto name = FieldValidator::validateName(item.name, itemField(i, "name"));
    if (!name) {
      return name.error();
    }
    if (auto error = FieldValidator::validateAmount(
            item.amount_cents, itemField(i, "amount_cents"))) {
      return *error;
    }
    // id 0 marks a new row
    if (item.id != 0) {
      if (auto error = FieldValidator::validateId(item.id, itemField(i, "id"))) {
        return *error;
      }
    }

    ManualBudgetItem clean;
    clean.id = item.id;
    clean.name = std::move(name).value();
    clean.amount_cents = item.amount_cents;
    validated.push_back(std::move(clean));
  }

  return ValidationOutcome<std::vector<ManualBudgetItem>>::success(
      std::move(validated));
}

RequestValidator::Result<std::vector<ManualBudgetItem>>
RequestValidator::validateManualBudgetItems(
    const std::vector<ManualBudgetItem> &items) {
  auto outcome = checkItems(items);
  if (!outcome) {
    return outcome.error();
  }
  return accept(std::move(outcome).value());
}

RequestValidator::Result<ManualBudgetRequest>
RequestValidator::validateManualBudget(const ManualBudgetRequest &request) {
  if (auto error = FieldValidator::validateYearMonth(request.year_month.year,
                                                     request.year_month.month)) {
    return *error;
  }
  if (auto error = FieldValidator::validateAmount(request.bank_amount_cents,
                                                  "bank_amount_cents")) {
    return *error;
  }
  auto items = checkItems(request.items);
  if (!items) {
    return items.error();
  }
  if (request.id != 0) {
    if (auto error = FieldValidator::validateId(request.id, "id")) {
      return *error;
    }
  }
  if (request.user_id != 0) {
    if (auto error = FieldValidator::validateUserId(request.user_id)) {
      return *error;
    }
  }

  ManualBudgetRequest validated;
  validated.id = request.id;
  validated.user_id = request.user_id;
  validated.year_month = request.year_month;
  validated.bank_amount_cents = request.bank_amount_cents;
  validated.items = std::move(items).value();
  return accept(std::move(validated));
}

RequestValidator::Result<LoginRequest>
RequestValidator::validateLogin(const LoginRequest &request) {
  auto username = FieldValidator::validateUsername(request.username);
  if (!username) {
    return username.error();
  }
  if (auto error = FieldValidator::validatePassword(request.password)) {
    return *error;
  }

  LoginRequest validated;
  validated.username = std::move(username).value();
  validated.password = request.password;
  ValidationLogger::debug("Login payload accepted for user {}",
                          validated.username);
  return accept(std::move(validated));
}

} // namespace ledgerguard
