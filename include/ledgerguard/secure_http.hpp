#pragma once

#include "ledgerguard/domain_models.hpp"
#include "ledgerguard/http_types.hpp"
#include "ledgerguard/validation_error.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

namespace ledgerguard {

/**
 * @brief Untrusted-input edge of every handler.
 *
 * Decodes JSON bodies strictly, parses path and query parameters, and builds
 * responses that always carry the JSON content type and the anti-sniffing
 * headers. Error bodies are sanitized and never echo the rejected value.
 */
class SecureHttpBoundary {
public:
  /**
   * @brief Strict JSON decode into a request shape.
   *
   * Checks run in this order: content type, empty body, syntax (and a
   * non-object top level), unknown keys, value types, trailing data.
   */
  template <typename T>
  static ValidationOutcome<T> decodeJson(const HttpRequest &request) {
    auto parsed = parseBody(request);
    if (!parsed) {
      return parsed.error();
    }
    const ParsedBody &body = parsed.value();

    if (!JsonShape<T>::hasOnlyKnownFields(body.document)) {
      return unknownFieldsError();
    }
    auto value = JsonShape<T>::read(body.document);
    if (!value) {
      return malformedJsonError();
    }
    if (body.trailingData) {
      return trailingDataError();
    }
    return ValidationOutcome<T>::success(std::move(*value));
  }

  // Screens, parses and range-checks an integer path parameter
  static ValidationOutcome<std::int64_t> parseUrlParam(std::string_view name,
                                                       std::string_view raw);

  // Reads year= and month= from the query part of a request target
  static ValidationOutcome<YearMonth> parseYearMonthQuery(std::string_view target);

  static HttpResponse jsonResponse(http::status status,
                                   const nlohmann::json &body);

  // {"error", "code"} with the code's default HTTP status
  static HttpResponse errorResponse(ErrorCode code, std::string_view message);

  // 400 with error, field and code; logs the rejection at WARN
  static HttpResponse validationErrorResponse(const ValidationError &error);

  static HttpResponse payloadTooLargeResponse();

  // Content-Type, X-Content-Type-Options, X-Frame-Options, X-XSS-Protection
  static void applyResponseHeaders(HttpResponse &response);

  static void applyBodyLimit(http::request_parser<http::string_body> &parser,
                             std::size_t limit);

private:
  struct ParsedBody {
    nlohmann::json document;
    bool trailingData = false;
  };

  static ValidationOutcome<ParsedBody> parseBody(const HttpRequest &request);

  static ValidationError unknownFieldsError();
  static ValidationError malformedJsonError();
  static ValidationError trailingDataError();
};

} // namespace ledgerguard
