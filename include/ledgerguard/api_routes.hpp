#pragma once

#include "ledgerguard/domain_models.hpp"
#include "ledgerguard/request_validator.hpp"
#include "ledgerguard/router.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <vector>

namespace ledgerguard {

/**
 * @brief Receiver of validated requests.
 *
 * Implementations sit behind the boundary (persistence, authentication) and
 * only ever see Validated<T> values. The returned JSON becomes the response
 * body.
 */
class RequestSink {
public:
  virtual ~RequestSink() = default;

  virtual nlohmann::json
  createIncomeSource(Validated<CreateIncomeSourceRequest> request) = 0;
  virtual nlohmann::json
  updateIncomeSource(std::int64_t id, Validated<UpdateSourceRequest> request) = 0;
  virtual nlohmann::json deleteIncomeSource(std::int64_t id) = 0;

  virtual nlohmann::json
  createBudgetSource(Validated<CreateBudgetSourceRequest> request) = 0;
  virtual nlohmann::json
  updateBudgetSource(std::int64_t id, Validated<UpdateSourceRequest> request) = 0;
  virtual nlohmann::json deleteBudgetSource(std::int64_t id) = 0;

  virtual nlohmann::json recordExpense(Validated<ExpenseRequest> request) = 0;

  // POST creates or replaces the month's budget; PUT carries the path id
  // in request.id
  virtual nlohmann::json
  saveManualBudget(Validated<ManualBudgetRequest> request) = 0;
  virtual nlohmann::json
  updateManualBudget(Validated<ManualBudgetRequest> request) = 0;

  virtual nlohmann::json login(Validated<LoginRequest> request) = 0;
};

// Answers with the sanitized payload; passwords are never echoed
class EchoRequestSink : public RequestSink {
public:
  nlohmann::json
  createIncomeSource(Validated<CreateIncomeSourceRequest> request) override;
  nlohmann::json updateIncomeSource(std::int64_t id,
                                    Validated<UpdateSourceRequest> request) override;
  nlohmann::json deleteIncomeSource(std::int64_t id) override;
  nlohmann::json
  createBudgetSource(Validated<CreateBudgetSourceRequest> request) override;
  nlohmann::json updateBudgetSource(std::int64_t id,
                                    Validated<UpdateSourceRequest> request) override;
  nlohmann::json deleteBudgetSource(std::int64_t id) override;
  nlohmann::json recordExpense(Validated<ExpenseRequest> request) override;
  nlohmann::json saveManualBudget(Validated<ManualBudgetRequest> request) override;
  nlohmann::json
  updateManualBudget(Validated<ManualBudgetRequest> request) override;
  nlohmann::json login(Validated<LoginRequest> request) override;
};

// GET /healthz and GET /readyz
void registerHealthRoutes(Router &router);

// The /api/v1/secure/... gateway routes
void registerApiRoutes(Router &router, std::shared_ptr<RequestSink> sink);

} // namespace ledgerguard
