#include "ledgerguard/secure_http.hpp"
#include "ledgerguard/field_validator.hpp"
#include "ledgerguard/logger.hpp"
#include "ledgerguard/pattern_detector.hpp"
#include "ledgerguard/sanitizer.hpp"
#include "ledgerguard/string_utils.hpp"
#include <iterator>
#include <sstream>
#include <string>

namespace ledgerguard {

namespace {

constexpr std::string_view kJsonContentType = "application/json";
constexpr std::string_view kInternalErrorBody =
    R"({"error":"internal server error","code":"INTERNAL_ERROR"})";
constexpr std::string_view kGenericErrorMessage = "an error occurred";

// First value of a query parameter, empty when absent
std::string queryValue(
    const std::vector<std::pair<std::string, std::string>> &params,
    std::string_view key) {
  for (const auto &[name, value] : params) {
    if (name == key) {
      return value;
    }
  }
  return {};
}

std::string safeMessage(std::string_view message) {
  auto sanitized = Sanitizer::sanitizeString(message, "error_message");
  if (!sanitized) {
    return std::string(kGenericErrorMessage);
  }
  return std::move(sanitized).value();
}

} // namespace

ValidationOutcome<SecureHttpBoundary::ParsedBody>
SecureHttpBoundary::parseBody(const HttpRequest &request) {
  const auto contentType = request[http::field::content_type];
  const std::string_view contentTypeView(contentType.data(), contentType.size());
  if (!string_utils::starts_with(contentTypeView, kJsonContentType)) {
    return ValidationError("Content-Type",
                           ValidationError::truncateValue(contentTypeView),
                           "invalid content type, expected application/json",
                           ErrorCode::INVALID_FORMAT);
  }

  const std::string &body = request.body();
  if (string_utils::is_whitespace(body)) {
    return ValidationError("body", "", "request body is empty",
                           ErrorCode::INVALID_INPUT);
  }

  ParsedBody parsed;
  std::istringstream stream(body);
  try {
    // operator>> stops after the first complete value
    stream >> parsed.document;
  } catch (const nlohmann::json::parse_error &e) {
    return ValidationError("body", ValidationError::truncateValue(e.what()),
                           "invalid JSON format", ErrorCode::INVALID_FORMAT);
  }

  if (!parsed.document.is_object()) {
    return malformedJsonError();
  }

  const std::string rest{std::istreambuf_iterator<char>(stream),
                         std::istreambuf_iterator<char>()};
  parsed.trailingData = !string_utils::is_whitespace(rest);

  return ValidationOutcome<ParsedBody>::success(std::move(parsed));
}

ValidationError SecureHttpBoundary::unknownFieldsError() {
  return ValidationError("body", "", "unknown fields not allowed",
                         ErrorCode::INVALID_INPUT);
}

ValidationError SecureHttpBoundary::malformedJsonError() {
  return ValidationError("body", "", "invalid JSON format",
                         ErrorCode::INVALID_FORMAT);
}

ValidationError SecureHttpBoundary::trailingDataError() {
  return ValidationError("body", "", "additional data found after JSON object",
                         ErrorCode::INVALID_FORMAT);
}

ValidationOutcome<std::int64_t>
SecureHttpBoundary::parseUrlParam(std::string_view name, std::string_view raw) {
  const std::string field(name);

  if (raw.empty()) {
    return ValidationError(field, "", field + " parameter is required",
                           ErrorCode::INVALID_INPUT);
  }

  if (PatternDetector::isSuspicious(raw)) {
    return ValidationError(field, ValidationError::truncateValue(raw),
                           "invalid characters in parameter",
                           ErrorCode::INVALID_INPUT);
  }

  auto parsed = string_utils::to_integer<std::int64_t>(raw);
  if (!parsed.success) {
    return ValidationError(field, ValidationError::truncateValue(raw),
                           "parameter must be a valid integer",
                           ErrorCode::INVALID_FORMAT);
  }

  if (auto error = FieldValidator::validateId(parsed.value, field)) {
    return *error;
  }
  return ValidationOutcome<std::int64_t>::success(parsed.value);
}

ValidationOutcome<YearMonth>
SecureHttpBoundary::parseYearMonthQuery(std::string_view target) {
  std::string_view query;
  if (auto pos = target.find('?'); pos != std::string_view::npos) {
    query = target.substr(pos + 1);
  }

  const auto params = string_utils::parse_query_string(query);
  const std::string yearText = queryValue(params, "year");
  const std::string monthText = queryValue(params, "month");
  const std::string combined = "year=" + yearText + "&month=" + monthText;

  if (yearText.empty() || monthText.empty()) {
    return ValidationError("query_params",
                           ValidationError::truncateValue(combined),
                           "year and month query parameters are required",
                           ErrorCode::INVALID_INPUT);
  }

  if (PatternDetector::isSuspicious(yearText) ||
      PatternDetector::isSuspicious(monthText)) {
    return ValidationError("query_params",
                           ValidationError::truncateValue(combined),
                           "invalid characters in query parameters",
                           ErrorCode::INVALID_INPUT);
  }

  auto year = string_utils::to_integer<std::int64_t>(yearText);
  if (!year.success) {
    return ValidationError("year", ValidationError::truncateValue(yearText),
                           "year must be a valid integer",
                           ErrorCode::INVALID_FORMAT);
  }

  auto month = string_utils::to_integer<std::int64_t>(monthText);
  if (!month.success) {
    return ValidationError("month", ValidationError::truncateValue(monthText),
                           "month must be a valid integer",
                           ErrorCode::INVALID_FORMAT);
  }

  if (auto error = FieldValidator::validateYearMonth(year.value, month.value)) {
    return *error;
  }
  // Range checked above, both fit in int
  return ValidationOutcome<YearMonth>::success(
      YearMonth{static_cast<int>(year.value), static_cast<int>(month.value)});
}

void SecureHttpBoundary::applyResponseHeaders(HttpResponse &response) {
  response.set(http::field::content_type, "application/json");
  response.set("X-Content-Type-Options", "nosniff");
  response.set("X-Frame-Options", "DENY");
  response.set("X-XSS-Protection", "1; mode=block");
}

HttpResponse SecureHttpBoundary::jsonResponse(http::status status,
                                              const nlohmann::json &body) {
  HttpResponse response{status, 11};
  applyResponseHeaders(response);

  try {
    response.body() = body.dump();
  } catch (const nlohmann::json::type_error &e) {
    SECURITY_LOG_ERROR("Response serialization failed: {}", e.what());
    HttpResponse fallback{http::status::internal_server_error, 11};
    applyResponseHeaders(fallback);
    fallback.body() = std::string(kInternalErrorBody);
    fallback.prepare_payload();
    return fallback;
  }

  response.prepare_payload();
  return response;
}

HttpResponse SecureHttpBoundary::errorResponse(ErrorCode code,
                                               std::string_view message) {
  return jsonResponse(static_cast<http::status>(getDefaultHttpStatus(code)),
                      {{"error", safeMessage(message)},
                       {"code", errorCodeToString(code)}});
}

HttpResponse
SecureHttpBoundary::validationErrorResponse(const ValidationError &error) {
  SECURITY_LOG_WARN("Request rejected: {}", error.toLogString());

  return jsonResponse(http::status::bad_request,
                      {{"error", safeMessage(error.message())},
                       {"field", error.field()},
                       {"code", errorCodeToString(error.code())}});
}

HttpResponse SecureHttpBoundary::payloadTooLargeResponse() {
  return errorResponse(ErrorCode::PAYLOAD_TOO_LARGE, "request body too large");
}

void SecureHttpBoundary::applyBodyLimit(
    http::request_parser<http::string_body> &parser, std::size_t limit) {
  parser.body_limit(limit);
}

} // namespace ledgerguard
