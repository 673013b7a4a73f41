#include "ledgerguard/api_routes.hpp"
#include "ledgerguard/secure_http.hpp"
#include <optional>

namespace ledgerguard {

namespace {

constexpr const char *kApiPrefix = "/api/v1/secure";

std::string apiPath(const char *suffix) {
  return std::string(kApiPrefix) + suffix;
}

// Decode -> validate -> deliver, answering the first failure
template <typename T, typename Validate, typename Deliver>
HttpResponse decodeAndDeliver(const HttpRequest &request, http::status status,
                              Validate validate, Deliver deliver) {
  auto decoded = SecureHttpBoundary::decodeJson<T>(request);
  if (!decoded) {
    return SecureHttpBoundary::validationErrorResponse(decoded.error());
  }
  auto validated = validate(decoded.value());
  if (!validated) {
    return SecureHttpBoundary::validationErrorResponse(validated.error());
  }
  return SecureHttpBoundary::jsonResponse(status,
                                          deliver(std::move(validated).value()));
}

std::string pathParam(const RequestContext &context, const char *name) {
  auto it = context.pathParams.find(name);
  return it == context.pathParams.end() ? std::string{} : it->second;
}

// The period comes from ?year=&month=, the path id (if any) replaces the
// body id
template <typename Deliver>
HttpResponse deliverManualBudget(const HttpRequest &request, http::status status,
                                 std::optional<std::int64_t> pathId,
                                 Deliver deliver) {
  auto period = SecureHttpBoundary::parseYearMonthQuery(requestTarget(request));
  if (!period) {
    return SecureHttpBoundary::validationErrorResponse(period.error());
  }
  const YearMonth yearMonth = period.value();
  return decodeAndDeliver<ManualBudgetRequest>(
      request, status,
      [yearMonth, pathId](const ManualBudgetRequest &body) {
        ManualBudgetRequest withPeriod = body;
        withPeriod.year_month = yearMonth;
        if (pathId) {
          withPeriod.id = *pathId;
        }
        return RequestValidator::validateManualBudget(withPeriod);
      },
      deliver);
}

void registerSourceRoutes(Router &router, const std::shared_ptr<RequestSink> &sink,
                          bool income) {
  const std::string collection =
      apiPath(income ? "/income-sources" : "/budget-sources");

  if (income) {
    router.addRoute(
        http::verb::post, collection,
        [sink](const HttpRequest &request, RequestContext &) {
          return decodeAndDeliver<CreateIncomeSourceRequest>(
              request, http::status::created,
              &RequestValidator::validateCreateIncomeSource,
              [&sink](Validated<CreateIncomeSourceRequest> valid) {
                return sink->createIncomeSource(std::move(valid));
              });
        });
  } else {
    router.addRoute(
        http::verb::post, collection,
        [sink](const HttpRequest &request, RequestContext &) {
          return decodeAndDeliver<CreateBudgetSourceRequest>(
              request, http::status::created,
              &RequestValidator::validateCreateBudgetSource,
              [&sink](Validated<CreateBudgetSourceRequest> valid) {
                return sink->createBudgetSource(std::move(valid));
              });
        });
  }

  router.addRoute(
      http::verb::put, collection + "/{id}",
      [sink, income](const HttpRequest &request, RequestContext &context) {
        auto id =
            SecureHttpBoundary::parseUrlParam("id", pathParam(context, "id"));
        if (!id) {
          return SecureHttpBoundary::validationErrorResponse(id.error());
        }
        const std::int64_t sourceId = id.value();
        return decodeAndDeliver<UpdateSourceRequest>(
            request, http::status::ok, &RequestValidator::validateUpdateSource,
            [&sink, income, sourceId](Validated<UpdateSourceRequest> valid) {
              return income ? sink->updateIncomeSource(sourceId, std::move(valid))
                            : sink->updateBudgetSource(sourceId, std::move(valid));
            });
      });

  router.addRoute(
      http::verb::delete_, collection + "/{id}",
      [sink, income](const HttpRequest &, RequestContext &context) {
        auto id =
            SecureHttpBoundary::parseUrlParam("id", pathParam(context, "id"));
        if (!id) {
          return SecureHttpBoundary::validationErrorResponse(id.error());
        }
        return SecureHttpBoundary::jsonResponse(
            http::status::ok, income ? sink->deleteIncomeSource(id.value())
                                     : sink->deleteBudgetSource(id.value()));
      });
}

} // namespace

// ============================================================================
// EchoRequestSink
// ============================================================================

nlohmann::json EchoRequestSink::createIncomeSource(
    Validated<CreateIncomeSourceRequest> request) {
  return request.get();
}

nlohmann::json
EchoRequestSink::updateIncomeSource(std::int64_t id,
                                    Validated<UpdateSourceRequest> request) {
  nlohmann::json body = request.get();
  body["id"] = id;
  return body;
}

nlohmann::json EchoRequestSink::deleteIncomeSource(std::int64_t id) {
  return {{"status", "deleted"}, {"id", id}};
}

nlohmann::json EchoRequestSink::createBudgetSource(
    Validated<CreateBudgetSourceRequest> request) {
  return request.get();
}

nlohmann::json
EchoRequestSink::updateBudgetSource(std::int64_t id,
                                    Validated<UpdateSourceRequest> request) {
  nlohmann::json body = request.get();
  body["id"] = id;
  return body;
}

nlohmann::json EchoRequestSink::deleteBudgetSource(std::int64_t id) {
  return {{"status", "deleted"}, {"id", id}};
}

nlohmann::json EchoRequestSink::recordExpense(Validated<ExpenseRequest> request) {
  return request.get();
}

nlohmann::json
EchoRequestSink::saveManualBudget(Validated<ManualBudgetRequest> request) {
  return request.get();
}

nlohmann::json
EchoRequestSink::updateManualBudget(Validated<ManualBudgetRequest> request) {
  return request.get();
}

nlohmann::json EchoRequestSink::login(Validated<LoginRequest> request) {
  return {{"username", request.get().username}};
}

// ============================================================================
// Route registration
// ============================================================================

void registerHealthRoutes(Router &router) {
  auto ok = [](const HttpRequest &, RequestContext &) {
    return SecureHttpBoundary::jsonResponse(http::status::ok,
                                            {{"status", "ok"}});
  };
  router.addRoute(http::verb::get, "/healthz", ok);
  router.addRoute(http::verb::get, "/readyz", ok);
}

void registerApiRoutes(Router &router, std::shared_ptr<RequestSink> sink) {
  registerSourceRoutes(router, sink, true);
  registerSourceRoutes(router, sink, false);

  router.addRoute(
      http::verb::post, apiPath("/expenses"),
      [sink](const HttpRequest &request, RequestContext &) {
        return decodeAndDeliver<ExpenseRequest>(
            request, http::status::created, &RequestValidator::validateExpense,
            [&sink](Validated<ExpenseRequest> valid) {
              return sink->recordExpense(std::move(valid));
            });
      });

  router.addRoute(
      http::verb::post, apiPath("/manual-budgets"),
      [sink](const HttpRequest &request, RequestContext &) {
        return deliverManualBudget(
            request, http::status::created, std::nullopt,
            [&sink](Validated<ManualBudgetRequest> valid) {
              return sink->saveManualBudget(std::move(valid));
            });
      });

  router.addRoute(
      http::verb::put, apiPath("/manual-budgets/{id}"),
      [sink](const HttpRequest &request, RequestContext &context) {
        auto id =
            SecureHttpBoundary::parseUrlParam("id", pathParam(context, "id"));
        if (!id) {
          return SecureHttpBoundary::validationErrorResponse(id.error());
        }
        return deliverManualBudget(
            request, http::status::ok, id.value(),
            [&sink](Validated<ManualBudgetRequest> valid) {
              return sink->updateManualBudget(std::move(valid));
            });
      });

  router.addRoute(
      http::verb::post, apiPath("/auth/login"),
      [sink](const HttpRequest &request, RequestContext &) {
        return decodeAndDeliver<LoginRequest>(
            request, http::status::ok, &RequestValidator::validateLogin,
            [&sink](Validated<LoginRequest> valid) {
              return sink->login(std::move(valid));
            });
      });
}

} // namespace ledgerguard
