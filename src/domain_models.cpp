#include "ledgerguard/domain_models.hpp"
#include <algorithm>
#include <initializer_list>
#include <limits>

namespace ledgerguard {

namespace {

using FieldList = std::initializer_list<std::string_view>;

bool keysWithin(const nlohmann::json &object, FieldList fields) {
  if (!object.is_object()) {
    return true; // shape mismatch is reported by read()
  }
  for (const auto &item : object.items()) {
    const std::string &key = item.key();
    if (std::find(fields.begin(), fields.end(), key) == fields.end()) {
      return false;
    }
  }
  return true;
}

bool readString(const nlohmann::json &object, const char *key,
                std::string &out) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    return false;
  }
  out = it->get<std::string>();
  return true;
}

template <typename Int>
bool readInteger(const nlohmann::json &object, const char *key, Int &out) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return true;
  }
  if (it->is_number_unsigned()) {
    const auto value = it->get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<Int>::max())) {
      return false;
    }
    out = static_cast<Int>(value);
    return true;
  }
  if (it->is_number_integer()) {
    const auto value = it->get<std::int64_t>();
    if (value < static_cast<std::int64_t>(std::numeric_limits<Int>::min()) ||
        value > static_cast<std::int64_t>(std::numeric_limits<Int>::max())) {
      return false;
    }
    out = static_cast<Int>(value);
    return true;
  }
  // Fractional numbers, strings, booleans, arrays and objects
  return false;
}

template <typename Source>
std::optional<Source> readCreateSource(const nlohmann::json &object) {
  if (!object.is_object()) {
    return std::nullopt;
  }
  Source source;
  if (!readString(object, "name", source.name) ||
      !readInteger(object, "year", source.year) ||
      !readInteger(object, "month", source.month) ||
      !readInteger(object, "amount_cents", source.amount_cents)) {
    return std::nullopt;
  }
  return source;
}

} // namespace

// ============================================================================
// JsonShape specializations
// ============================================================================

bool JsonShape<CreateIncomeSourceRequest>::hasOnlyKnownFields(
    const nlohmann::json &object) {
  return keysWithin(object, {"name", "year", "month", "amount_cents"});
}

std::optional<CreateIncomeSourceRequest>
JsonShape<CreateIncomeSourceRequest>::read(const nlohmann::json &object) {
  return readCreateSource<CreateIncomeSourceRequest>(object);
}

bool JsonShape<CreateBudgetSourceRequest>::hasOnlyKnownFields(
    const nlohmann::json &object) {
  return keysWithin(object, {"name", "year", "month", "amount_cents"});
}

std::optional<CreateBudgetSourceRequest>
JsonShape<CreateBudgetSourceRequest>::read(const nlohmann::json &object) {
  return readCreateSource<CreateBudgetSourceRequest>(object);
}

bool JsonShape<UpdateSourceRequest>::hasOnlyKnownFields(
    const nlohmann::json &object) {
  return keysWithin(object, {"name", "amount_cents"});
}

std::optional<UpdateSourceRequest>
JsonShape<UpdateSourceRequest>::read(const nlohmann::json &object) {
  if (!object.is_object()) {
    return std::nullopt;
  }
  UpdateSourceRequest request;
  if (!readString(object, "name", request.name) ||
      !readInteger(object, "amount_cents", request.amount_cents)) {
    return std::nullopt;
  }
  return request;
}

bool JsonShape<ExpenseRequest>::hasOnlyKnownFields(
    const nlohmann::json &object) {
  return keysWithin(object,
                    {"year", "month", "category", "description", "amount_cents"});
}

std::optional<ExpenseRequest>
JsonShape<ExpenseRequest>::read(const nlohmann::json &object) {
  if (!object.is_object()) {
    return std::nullopt;
  }
  ExpenseRequest expense;
  if (!readInteger(object, "year", expense.year) ||
      !readInteger(object, "month", expense.month) ||
      !readString(object, "category", expense.category) ||
      !readString(object, "description", expense.description) ||
      !readInteger(object, "amount_cents", expense.amount_cents)) {
    return std::nullopt;
  }
  return expense;
}

bool JsonShape<ManualBudgetRequest>::hasOnlyKnownFields(
    const nlohmann::json &object) {
  if (!keysWithin(object,
                  {"id", "user_id", "bank_amount_cents", "items"})) {
    return false;
  }
  if (!object.is_object()) {
    return true;
  }
  auto items = object.find("items");
  if (items == object.end() || !items->is_array()) {
    return true;
  }
  return std::all_of(items->begin(), items->end(),
                     [](const nlohmann::json &item) {
                       return keysWithin(item, {"id", "name", "amount_cents"});
                     });
}

std::optional<ManualBudgetRequest>
JsonShape<ManualBudgetRequest>::read(const nlohmann::json &object) {
  if (!object.is_object()) {
    return std::nullopt;
  }
  ManualBudgetRequest budget;
  if (!readInteger(object, "id", budget.id) ||
      !readInteger(object, "user_id", budget.user_id) ||
      !readInteger(object, "bank_amount_cents", budget.bank_amount_cents)) {
    return std::nullopt;
  }

  auto items = object.find("items");
  if (items == object.end() || items->is_null()) {
    return budget;
  }
  if (!items->is_array()) {
    return std::nullopt;
  }

  budget.items.reserve(items->size());
  for (const auto &entry : *items) {
    if (!entry.is_object()) {
      return std::nullopt;
    }
    ManualBudgetItem item;
    if (!readInteger(entry, "id", item.id) ||
        !readString(entry, "name", item.name) ||
        !readInteger(entry, "amount_cents", item.amount_cents)) {
      return std::nullopt;
    }
    budget.items.push_back(std::move(item));
  }
  return budget;
}

bool JsonShape<LoginRequest>::hasOnlyKnownFields(const nlohmann::json &object) {
  return keysWithin(object, {"username", "password"});
}

std::optional<LoginRequest>
JsonShape<LoginRequest>::read(const nlohmann::json &object) {
  if (!object.is_object()) {
    return std::nullopt;
  }
  LoginRequest login;
  if (!readString(object, "username", login.username) ||
      !readString(object, "password", login.password)) {
    return std::nullopt;
  }
  return login;
}

// ============================================================================
// Response serialization
// ============================================================================

void to_json(nlohmann::json &j, const YearMonth &value) {
  j = nlohmann::json{{"year", value.year}, {"month", value.month}};
}

void to_json(nlohmann::json &j, const CreateIncomeSourceRequest &value) {
  j = nlohmann::json{{"name", value.name},
                     {"year", value.year},
                     {"month", value.month},
                     {"amount_cents", value.amount_cents}};
}

void to_json(nlohmann::json &j, const CreateBudgetSourceRequest &value) {
  j = nlohmann::json{{"name", value.name},
                     {"year", value.year},
                     {"month", value.month},
                     {"amount_cents", value.amount_cents}};
}

void to_json(nlohmann::json &j, const UpdateSourceRequest &value) {
  j = nlohmann::json{{"name", value.name},
                     {"amount_cents", value.amount_cents}};
}

void to_json(nlohmann::json &j, const ExpenseRequest &value) {
  j = nlohmann::json{{"year", value.year},
                     {"month", value.month},
                     {"category", value.category},
                     {"description", value.description},
                     {"amount_cents", value.amount_cents}};
}

void to_json(nlohmann::json &j, const ManualBudgetItem &value) {
  j = nlohmann::json{{"id", value.id},
                     {"name", value.name},
                     {"amount_cents", value.amount_cents}};
}

void to_json(nlohmann::json &j, const ManualBudgetRequest &value) {
  j = nlohmann::json{{"id", value.id},
                     {"user_id", value.user_id},
                     {"year", value.year_month.year},
                     {"month", value.year_month.month},
                     {"bank_amount_cents", value.bank_amount_cents},
                     {"items", value.items}};
}

} // namespace ledgerguard
