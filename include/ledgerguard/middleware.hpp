#pragma once

#include "ledgerguard/http_types.hpp"
#include "ledgerguard/string_hash.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ledgerguard {

class RateLimiter;

// Per-request data shared along the middleware chain
struct RequestContext {
  std::string remoteAddress;
  std::string requestId;
  StringMap<std::string> pathParams;
};

using Handler = std::function<HttpResponse(const HttpRequest &, RequestContext &)>;
using Middleware = std::function<Handler(Handler)>;

/**
 * Wraps `terminal` so that middlewares[0] sees the request first and the
 * response last.
 */
Handler buildChain(Handler terminal, const std::vector<Middleware> &middlewares);

namespace middleware {

// Full response header set, including the Content-Security-Policy
void applySecurityHeaders(HttpResponse &response);

// 32 lowercase hex characters
std::string generateRequestId();

Middleware securityHeaders();

// Propagates a well-formed X-Request-ID or generates one
Middleware requestId();

// 429 with Retry-After when rejected; X-RateLimit-* on passing responses
Middleware rateLimit(std::shared_ptr<RateLimiter> limiter);

// Screens User-Agent and Referer; /healthz and /readyz bypass
Middleware inputSanity();

// Requires X-API-Key on /api/ paths
Middleware apiKey(std::string expectedKey);

} // namespace middleware

} // namespace ledgerguard
