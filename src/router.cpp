#include "ledgerguard/router.hpp"
#include "ledgerguard/logger.hpp"
#include "ledgerguard/secure_http.hpp"
#include "ledgerguard/string_utils.hpp"
#include <exception>

namespace ledgerguard {

void Router::addRoute(http::verb method, std::string pattern, Handler handler) {
  Route route;
  route.method = method;
  for (auto segment : splitPath(pattern)) {
    route.segments.emplace_back(segment);
  }
  route.pattern = std::move(pattern);
  route.handler = std::move(handler);

  RouterLogger::debug("Registered {} {}",
                      verbName(method), route.pattern);
  routes_.push_back(std::move(route));
}

std::vector<std::string_view> Router::splitPath(std::string_view path) {
  std::vector<std::string_view> segments;
  for (auto segment : string_utils::split_view(path, '/')) {
    if (!segment.empty()) {
      segments.push_back(segment);
    }
  }
  return segments;
}

bool Router::matchSegments(const std::vector<std::string> &pattern,
                           const std::vector<std::string_view> &path,
                           StringMap<std::string> &params) {
  if (pattern.size() != path.size()) {
    return false;
  }

  StringMap<std::string> captured;
  for (std::size_t i = 0; i < pattern.size(); ++i) {
    const std::string &expected = pattern[i];
    if (expected.size() > 2 && expected.front() == '{' &&
        expected.back() == '}') {
      captured.emplace(expected.substr(1, expected.size() - 2),
                       string_utils::url_decode(path[i]));
    } else if (expected != path[i]) {
      return false;
    }
  }

  params = std::move(captured);
  return true;
}

HttpResponse Router::dispatch(const HttpRequest &request,
                              RequestContext &context) const {
  const auto path = targetPath(requestTarget(request));
  const auto segments = splitPath(path);

  bool pathKnown = false;
  std::string allowed;

  for (const auto &route : routes_) {
    StringMap<std::string> params;
    if (!matchSegments(route.segments, segments, params)) {
      continue;
    }
    pathKnown = true;

    if (route.method != request.method()) {
      if (!allowed.empty()) {
        allowed += ", ";
      }
      allowed += verbName(route.method);
      continue;
    }

    context.pathParams = std::move(params);
    try {
      return route.handler(request, context);
    } catch (const std::exception &e) {
      RouterLogger::error("Handler for {} failed: {}", route.pattern, e.what());
      return SecureHttpBoundary::errorResponse(ErrorCode::INTERNAL_ERROR,
                                               "internal server error");
    }
  }

  if (pathKnown) {
    auto response = SecureHttpBoundary::errorResponse(
        ErrorCode::METHOD_NOT_ALLOWED, "method not allowed");
    response.set(http::field::allow, allowed);
    return response;
  }

  return SecureHttpBoundary::errorResponse(ErrorCode::NOT_FOUND, "not found");
}

Handler Router::asHandler() const {
  return [this](const HttpRequest &request, RequestContext &context) {
    return dispatch(request, context);
  };
}

} // namespace ledgerguard
