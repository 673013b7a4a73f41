#include "ledgerguard/secure_http.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace ledgerguard;

class SecureHttpTest : public ::testing::Test {
protected:
  static HttpRequest jsonRequest(const std::string &body,
                                 const std::string &contentType =
                                     "application/json") {
    HttpRequest request{http::verb::post, "/api/v1/secure/expenses", 11};
    if (!contentType.empty()) {
      request.set(http::field::content_type, contentType);
    }
    request.body() = body;
    request.prepare_payload();
    return request;
  }

  template <typename T>
  static ValidationError decodeError(const std::string &body) {
    auto outcome = SecureHttpBoundary::decodeJson<T>(jsonRequest(body));
    EXPECT_FALSE(outcome.isValid()) << body;
    return outcome.isValid()
               ? ValidationError("", "", "", ErrorCode::INTERNAL_ERROR)
               : outcome.error();
  }

  static nlohmann::json bodyOf(const HttpResponse &response) {
    return nlohmann::json::parse(response.body());
  }

  static std::string header(const HttpResponse &response,
                            const std::string &name) {
    auto it = response.find(name);
    return it == response.end() ? std::string{}
                                : std::string(it->value().data(),
                                              it->value().size());
  }
};

// Strict decoding

TEST_F(SecureHttpTest, DecodesAWellFormedBody) {
  auto outcome = SecureHttpBoundary::decodeJson<ExpenseRequest>(jsonRequest(
      R"({"year":2024,"month":3,"category":"food","description":"Lunch","amount_cents":1250})",
      "application/json; charset=utf-8"));

  ASSERT_TRUE(outcome.isValid());
  EXPECT_EQ(outcome.value().year, 2024);
  EXPECT_EQ(outcome.value().month, 3);
  EXPECT_EQ(outcome.value().category, "food");
  EXPECT_EQ(outcome.value().amount_cents, 1250);
}

TEST_F(SecureHttpTest, RejectsWrongContentType) {
  auto outcome = SecureHttpBoundary::decodeJson<LoginRequest>(
      jsonRequest(R"({"username":"a"})", "text/plain"));

  ASSERT_FALSE(outcome.isValid());
  EXPECT_EQ(outcome.error().field(), "Content-Type");
  EXPECT_EQ(outcome.error().code(), ErrorCode::INVALID_FORMAT);
  EXPECT_EQ(outcome.error().message(),
            "invalid content type, expected application/json");

  auto missing = SecureHttpBoundary::decodeJson<LoginRequest>(
      jsonRequest(R"({"username":"a"})", ""));
  EXPECT_FALSE(missing.isValid());
}

TEST_F(SecureHttpTest, RejectsEmptyBody) {
  auto error = decodeError<LoginRequest>("  \n ");
  EXPECT_EQ(error.field(), "body");
  EXPECT_EQ(error.code(), ErrorCode::INVALID_INPUT);
  EXPECT_EQ(error.message(), "request body is empty");
}

TEST_F(SecureHttpTest, RejectsMalformedJson) {
  EXPECT_EQ(decodeError<LoginRequest>("{").message(), "invalid JSON format");
  EXPECT_EQ(decodeError<LoginRequest>("[1,2]").message(),
            "invalid JSON format");
  EXPECT_EQ(decodeError<LoginRequest>("\"text\"").code(),
            ErrorCode::INVALID_FORMAT);
}

TEST_F(SecureHttpTest, RejectsUnknownFields) {
  auto error =
      decodeError<UpdateSourceRequest>(R"({"name":"a","extra":1})");
  EXPECT_EQ(error.message(), "unknown fields not allowed");
  EXPECT_EQ(error.code(), ErrorCode::INVALID_INPUT);
}

TEST_F(SecureHttpTest, RejectsUnknownFieldsInsideItems) {
  auto error = decodeError<ManualBudgetRequest>(
      R"({"bank_amount_cents":1,"items":[{"name":"a","amount_cents":1,"bogus":true}]})");
  EXPECT_EQ(error.message(), "unknown fields not allowed");
}

TEST_F(SecureHttpTest, RejectsTypeMismatches) {
  EXPECT_EQ(decodeError<UpdateSourceRequest>(R"({"name":5})").message(),
            "invalid JSON format");
  EXPECT_EQ(
      decodeError<UpdateSourceRequest>(R"({"name":"a","amount_cents":1.5})")
          .message(),
      "invalid JSON format");
  EXPECT_EQ(decodeError<UpdateSourceRequest>(
                R"({"name":"a","amount_cents":"100"})")
                .message(),
            "invalid JSON format");
  EXPECT_EQ(
      decodeError<ExpenseRequest>(R"({"year":99999999999,"month":1})")
          .message(),
      "invalid JSON format");
  EXPECT_EQ(decodeError<ManualBudgetRequest>(R"({"items":{}})").message(),
            "invalid JSON format");
}

TEST_F(SecureHttpTest, RejectsTrailingData) {
  auto error = decodeError<UpdateSourceRequest>(
      R"({"name":"a","amount_cents":1} {"name":"b"})");
  EXPECT_EQ(error.message(), "additional data found after JSON object");
  EXPECT_EQ(error.code(), ErrorCode::INVALID_FORMAT);
}

TEST_F(SecureHttpTest, TrailingWhitespaceIsAllowed) {
  auto outcome = SecureHttpBoundary::decodeJson<UpdateSourceRequest>(
      jsonRequest("{\"name\":\"a\",\"amount_cents\":1}\n  "));
  EXPECT_TRUE(outcome.isValid());
}

TEST_F(SecureHttpTest, NullAndMissingFieldsKeepZeroValues) {
  auto outcome = SecureHttpBoundary::decodeJson<UpdateSourceRequest>(
      jsonRequest(R"({"name":null})"));

  ASSERT_TRUE(outcome.isValid());
  EXPECT_EQ(outcome.value().name, "");
  EXPECT_EQ(outcome.value().amount_cents, 0);
}

// Path and query parameters

TEST_F(SecureHttpTest, ParseUrlParam) {
  auto ok = SecureHttpBoundary::parseUrlParam("id", "42");
  ASSERT_TRUE(ok.isValid());
  EXPECT_EQ(ok.value(), 42);

  auto missing = SecureHttpBoundary::parseUrlParam("id", "");
  ASSERT_FALSE(missing.isValid());
  EXPECT_EQ(missing.error().code(), ErrorCode::INVALID_INPUT);
  EXPECT_EQ(missing.error().message(), "id parameter is required");

  auto suspicious = SecureHttpBoundary::parseUrlParam("id", "1--");
  ASSERT_FALSE(suspicious.isValid());
  EXPECT_EQ(suspicious.error().message(), "invalid characters in parameter");

  for (const char *raw : {"abc", "+5", "4.2", " 7", "99999999999999999999"}) {
    auto bad = SecureHttpBoundary::parseUrlParam("id", raw);
    ASSERT_FALSE(bad.isValid()) << raw;
    EXPECT_EQ(bad.error().code(), ErrorCode::INVALID_FORMAT) << raw;
  }

  auto zero = SecureHttpBoundary::parseUrlParam("id", "0");
  ASSERT_FALSE(zero.isValid());
  EXPECT_EQ(zero.error().code(), ErrorCode::INVALID_RANGE);
}

TEST_F(SecureHttpTest, ParseYearMonthQuery) {
  auto ok = SecureHttpBoundary::parseYearMonthQuery(
      "/api/v1/secure/manual-budgets?year=2024&month=3");
  ASSERT_TRUE(ok.isValid());
  EXPECT_EQ(ok.value().year, 2024);
  EXPECT_EQ(ok.value().month, 3);

  auto missing = SecureHttpBoundary::parseYearMonthQuery("/x?year=2024");
  ASSERT_FALSE(missing.isValid());
  EXPECT_EQ(missing.error().field(), "query_params");
  EXPECT_EQ(missing.error().code(), ErrorCode::INVALID_INPUT);

  auto noQuery = SecureHttpBoundary::parseYearMonthQuery("/x");
  EXPECT_FALSE(noQuery.isValid());

  auto notNumber = SecureHttpBoundary::parseYearMonthQuery("/x?year=abc&month=1");
  ASSERT_FALSE(notNumber.isValid());
  EXPECT_EQ(notNumber.error().field(), "year");
  EXPECT_EQ(notNumber.error().code(), ErrorCode::INVALID_FORMAT);

  auto outOfRange =
      SecureHttpBoundary::parseYearMonthQuery("/x?year=2024&month=13");
  ASSERT_FALSE(outOfRange.isValid());
  EXPECT_EQ(outOfRange.error().field(), "month");
  EXPECT_EQ(outOfRange.error().code(), ErrorCode::INVALID_RANGE);

  auto injected = SecureHttpBoundary::parseYearMonthQuery(
      "/x?year=2024%27%3B--&month=1");
  ASSERT_FALSE(injected.isValid());
  EXPECT_EQ(injected.error().field(), "query_params");
}

TEST_F(SecureHttpTest, ParseYearMonthQueryReportsHugeValuesAsOutOfRange) {
  auto hugeYear = SecureHttpBoundary::parseYearMonthQuery(
      "/x?year=99999999999&month=1");
  ASSERT_FALSE(hugeYear.isValid());
  EXPECT_EQ(hugeYear.error().field(), "year");
  EXPECT_EQ(hugeYear.error().code(), ErrorCode::INVALID_RANGE);

  auto hugeMonth = SecureHttpBoundary::parseYearMonthQuery(
      "/x?year=2024&month=4294967297");
  ASSERT_FALSE(hugeMonth.isValid());
  EXPECT_EQ(hugeMonth.error().field(), "month");
  EXPECT_EQ(hugeMonth.error().code(), ErrorCode::INVALID_RANGE);

  auto beyondInt64 = SecureHttpBoundary::parseYearMonthQuery(
      "/x?year=99999999999999999999&month=1");
  ASSERT_FALSE(beyondInt64.isValid());
  EXPECT_EQ(beyondInt64.error().field(), "year");
  EXPECT_EQ(beyondInt64.error().code(), ErrorCode::INVALID_FORMAT);
}

// Responses

TEST_F(SecureHttpTest, JsonResponseCarriesSecurityHeaders) {
  auto response =
      SecureHttpBoundary::jsonResponse(http::status::ok, {{"status", "ok"}});

  EXPECT_EQ(response.result(), http::status::ok);
  EXPECT_EQ(header(response, "Content-Type"), "application/json");
  EXPECT_EQ(header(response, "X-Content-Type-Options"), "nosniff");
  EXPECT_EQ(header(response, "X-Frame-Options"), "DENY");
  EXPECT_EQ(header(response, "X-XSS-Protection"), "1; mode=block");
  EXPECT_EQ(bodyOf(response)["status"], "ok");
}

TEST_F(SecureHttpTest, SerializationFailureFallsBackToLiteral500) {
  nlohmann::json body = {{"name", std::string("bad\xff utf8")}};

  auto response = SecureHttpBoundary::jsonResponse(http::status::ok, body);

  EXPECT_EQ(response.result(), http::status::internal_server_error);
  EXPECT_EQ(response.body(),
            R"({"error":"internal server error","code":"INTERNAL_ERROR"})");
  EXPECT_EQ(header(response, "Content-Type"), "application/json");
}

TEST_F(SecureHttpTest, ErrorResponseSanitizesMessage) {
  auto plain =
      SecureHttpBoundary::errorResponse(ErrorCode::NOT_FOUND, "not found");
  EXPECT_EQ(bodyOf(plain)["error"], "not found");

  auto hostile = SecureHttpBoundary::errorResponse(
      ErrorCode::INVALID_INPUT, "<script>alert(1)</script>");
  EXPECT_EQ(bodyOf(hostile)["error"], "an error occurred");
  EXPECT_EQ(bodyOf(hostile)["code"], "INVALID_INPUT");
}

TEST_F(SecureHttpTest, ErrorResponseStatusFollowsTheCode) {
  const std::pair<ErrorCode, http::status> cases[] = {
      {ErrorCode::PAYLOAD_TOO_LARGE, http::status::payload_too_large},
      {ErrorCode::RATE_LIMIT_EXCEEDED, http::status::too_many_requests},
      {ErrorCode::UNAUTHORIZED, http::status::unauthorized},
      {ErrorCode::NOT_FOUND, http::status::not_found},
      {ErrorCode::METHOD_NOT_ALLOWED, http::status::method_not_allowed},
      {ErrorCode::INTERNAL_ERROR, http::status::internal_server_error},
  };

  for (const auto &[code, status] : cases) {
    auto response = SecureHttpBoundary::errorResponse(code, "failed");
    EXPECT_EQ(response.result(), status) << errorCodeToString(code);
    auto body = bodyOf(response);
    EXPECT_EQ(body["code"], errorCodeToString(code));
    EXPECT_EQ(body["error"], "failed");
    EXPECT_EQ(body.size(), 2u);
  }
}

TEST_F(SecureHttpTest, ValidationErrorResponseNeverEchoesTheValue) {
  ValidationError error("name", "secret-value", "name contains invalid characters",
                        ErrorCode::INVALID_CHARACTERS);

  auto response = SecureHttpBoundary::validationErrorResponse(error);

  EXPECT_EQ(response.result(), http::status::bad_request);
  auto body = bodyOf(response);
  EXPECT_EQ(body["error"], "name contains invalid characters");
  EXPECT_EQ(body["field"], "name");
  EXPECT_EQ(body["code"], "INVALID_CHARACTERS");
  EXPECT_EQ(body.size(), 3u);
  EXPECT_EQ(response.body().find("secret-value"), std::string::npos);
}

TEST_F(SecureHttpTest, PayloadTooLargeResponse) {
  auto response = SecureHttpBoundary::payloadTooLargeResponse();
  EXPECT_EQ(response.result(), http::status::payload_too_large);
  EXPECT_EQ(bodyOf(response)["error"], "request body too large");
  EXPECT_EQ(bodyOf(response)["code"], "PAYLOAD_TOO_LARGE");
}
