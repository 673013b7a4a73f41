#pragma once

#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ledgerguard {

// ============================================================================
// Request payloads accepted at the boundary
// ============================================================================

struct YearMonth {
  int year = 0;
  int month = 0;
};

struct CreateIncomeSourceRequest {
  std::string name;
  int year = 0;
  int month = 0;
  std::int64_t amount_cents = 0;
};

struct CreateBudgetSourceRequest {
  std::string name;
  int year = 0;
  int month = 0;
  std::int64_t amount_cents = 0;
};

struct UpdateSourceRequest {
  std::string name;
  std::int64_t amount_cents = 0;
};

struct ExpenseRequest {
  int year = 0;
  int month = 0;
  std::string category;
  std::string description;
  std::int64_t amount_cents = 0;
};

struct ManualBudgetItem {
  std::int64_t id = 0;
  std::string name;
  std::int64_t amount_cents = 0;
};

// year_month comes from the query string, not the body. id and user_id are
// optional (zero when absent); a PUT path id replaces the body id.
struct ManualBudgetRequest {
  std::int64_t id = 0;
  std::int64_t user_id = 0;
  YearMonth year_month;
  std::int64_t bank_amount_cents = 0;
  std::vector<ManualBudgetItem> items;
};

struct LoginRequest {
  std::string username;
  std::string password;
};

// ============================================================================
// Strict JSON shapes
// ============================================================================

/**
 * JsonShape<T> describes the wire form of a payload:
 *  - hasOnlyKnownFields() rejects any key outside the shape, nested item keys
 *    included;
 *  - read() converts a JSON object, returning nullopt on a type mismatch.
 *    Missing keys and explicit nulls leave the zero value. Integers must be
 *    integral JSON numbers that fit the target type.
 */
template <typename T> struct JsonShape;

#define LEDGERGUARD_DECLARE_JSON_SHAPE(Type)                                   \
  template <> struct JsonShape<Type> {                                         \
    static bool hasOnlyKnownFields(const nlohmann::json &object);              \
    static std::optional<Type> read(const nlohmann::json &object);             \
  }

LEDGERGUARD_DECLARE_JSON_SHAPE(CreateIncomeSourceRequest);
LEDGERGUARD_DECLARE_JSON_SHAPE(CreateBudgetSourceRequest);
LEDGERGUARD_DECLARE_JSON_SHAPE(UpdateSourceRequest);
LEDGERGUARD_DECLARE_JSON_SHAPE(ExpenseRequest);
LEDGERGUARD_DECLARE_JSON_SHAPE(ManualBudgetRequest);
LEDGERGUARD_DECLARE_JSON_SHAPE(LoginRequest);

#undef LEDGERGUARD_DECLARE_JSON_SHAPE

// Response serialization. LoginRequest has none: passwords never leave.
void to_json(nlohmann::json &j, const YearMonth &value);
void to_json(nlohmann::json &j, const CreateIncomeSourceRequest &value);
void to_json(nlohmann::json &j, const CreateBudgetSourceRequest &value);
void to_json(nlohmann::json &j, const UpdateSourceRequest &value);
void to_json(nlohmann::json &j, const ExpenseRequest &value);
void to_json(nlohmann::json &j, const ManualBudgetItem &value);
void to_json(nlohmann::json &j, const ManualBudgetRequest &value);

} // namespace ledgerguard
