#include "ledgerguard/domain_models.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace ledgerguard;
using nlohmann::json;

class DomainModelsTest : public ::testing::Test {
protected:
  using BudgetShape = JsonShape<ManualBudgetRequest>;
};

TEST_F(DomainModelsTest, ManualBudgetAcceptsIdAndUserId) {
  auto object = json::parse(
      R"({"id":4,"user_id":9,"bank_amount_cents":1500,
          "items":[{"id":2,"name":"Rent","amount_cents":1200}]})");

  ASSERT_TRUE(BudgetShape::hasOnlyKnownFields(object));
  auto budget = BudgetShape::read(object);
  ASSERT_TRUE(budget.has_value());
  EXPECT_EQ(budget->id, 4);
  EXPECT_EQ(budget->user_id, 9);
  EXPECT_EQ(budget->bank_amount_cents, 1500);
  ASSERT_EQ(budget->items.size(), 1u);
  EXPECT_EQ(budget->items[0].id, 2);
  EXPECT_EQ(budget->items[0].name, "Rent");
}

TEST_F(DomainModelsTest, ManualBudgetRejectsUnknownKeysAtEitherLevel) {
  EXPECT_FALSE(BudgetShape::hasOnlyKnownFields(
      json::parse(R"({"bank_amount_cents":1,"owner":"x"})")));
  EXPECT_FALSE(BudgetShape::hasOnlyKnownFields(
      json::parse(R"({"items":[{"name":"a","budget_id":3}]})")));
  // Period travels in the query string only
  EXPECT_FALSE(BudgetShape::hasOnlyKnownFields(
      json::parse(R"({"year":2024,"month":1})")));
}

TEST_F(DomainModelsTest, NullsAndMissingKeysLeaveZeroValues) {
  auto budget =
      BudgetShape::read(json::parse(R"({"id":null,"items":null})"));

  ASSERT_TRUE(budget.has_value());
  EXPECT_EQ(budget->id, 0);
  EXPECT_EQ(budget->user_id, 0);
  EXPECT_EQ(budget->bank_amount_cents, 0);
  EXPECT_TRUE(budget->items.empty());
}

TEST_F(DomainModelsTest, NonIntegralNumbersAreTypeMismatches) {
  EXPECT_FALSE(BudgetShape::read(json::parse(R"({"id":1.5})")).has_value());
  EXPECT_FALSE(BudgetShape::read(json::parse(R"({"user_id":"7"})")).has_value());
  EXPECT_FALSE(
      BudgetShape::read(json::parse(R"({"items":[{"amount_cents":true}]})"))
          .has_value());
  EXPECT_FALSE(BudgetShape::read(json::parse(R"({"items":{}})")).has_value());
  EXPECT_FALSE(BudgetShape::read(json::parse("[]")).has_value());
}

TEST_F(DomainModelsTest, IntegersMustFitTheTargetType) {
  auto tooBig = json::parse(
      R"({"name":"x","year":99999999999,"month":1,"amount_cents":1})");
  EXPECT_FALSE(JsonShape<CreateIncomeSourceRequest>::read(tooBig).has_value());

  auto unsignedMax =
      json::parse(R"({"bank_amount_cents":18446744073709551615})");
  EXPECT_FALSE(BudgetShape::read(unsignedMax).has_value());
}

TEST_F(DomainModelsTest, ManualBudgetSerializesIdsAndPeriod) {
  ManualBudgetRequest budget;
  budget.id = 8;
  budget.user_id = 2;
  budget.year_month = {2024, 7};
  budget.bank_amount_cents = 300;
  budget.items.push_back({5, "Food", 250});

  json j = budget;
  EXPECT_EQ(j["id"], 8);
  EXPECT_EQ(j["user_id"], 2);
  EXPECT_EQ(j["year"], 2024);
  EXPECT_EQ(j["month"], 7);
  EXPECT_EQ(j["bank_amount_cents"], 300);
  EXPECT_EQ(j["items"][0]["name"], "Food");
  EXPECT_EQ(j["items"][0]["amount_cents"], 250);
}

TEST_F(DomainModelsTest, LoginShapeOnlyKnowsCredentials) {
  using LoginShape = JsonShape<LoginRequest>;
  EXPECT_TRUE(LoginShape::hasOnlyKnownFields(
      json::parse(R"({"username":"a","password":"b"})")));
  EXPECT_FALSE(LoginShape::hasOnlyKnownFields(
      json::parse(R"({"username":"a","role":"admin"})")));
}
