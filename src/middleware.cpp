#include "ledgerguard/middleware.hpp"
#include "ledgerguard/field_validator.hpp"
#include "ledgerguard/logger.hpp"
#include "ledgerguard/pattern_detector.hpp"
#include "ledgerguard/rate_limiter.hpp"
#include "ledgerguard/secure_http.hpp"
#include "ledgerguard/string_utils.hpp"
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace ledgerguard {

namespace {

constexpr const char *kContentSecurityPolicy =
    "default-src 'self'; "
    "script-src 'self' 'unsafe-inline' https://unpkg.com "
    "https://cdn.jsdelivr.net https://esm.run; "
    "style-src 'self' 'unsafe-inline' https://unpkg.com "
    "https://cdn.jsdelivr.net; "
    "font-src 'self' https://unpkg.com https://cdn.jsdelivr.net; "
    "connect-src 'self'; "
    "img-src 'self' data:; "
    "frame-ancestors 'none';";

constexpr std::size_t kMaxRequestIdLength = 128;

bool isHealthPath(std::string_view path) {
  return path == "/healthz" || path == "/readyz";
}

bool isAcceptableRequestId(std::string_view id) {
  if (id.empty() || id.size() > kMaxRequestIdLength) {
    return false;
  }
  for (char c : id) {
    const auto uc = static_cast<unsigned char>(c);
    if (!std::isalnum(uc) && c != '-' && c != '_' && c != '.') {
      return false;
    }
  }
  return true;
}

// Compares without early exit on the first differing byte
bool constantTimeEquals(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  unsigned char diff = 0;
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    diff |= static_cast<unsigned char>(lhs[i] ^ rhs[i]);
  }
  return diff == 0;
}

} // namespace

Handler buildChain(Handler terminal, const std::vector<Middleware> &middlewares) {
  Handler handler = std::move(terminal);
  for (auto it = middlewares.rbegin(); it != middlewares.rend(); ++it) {
    handler = (*it)(std::move(handler));
  }
  return handler;
}

namespace middleware {

void applySecurityHeaders(HttpResponse &response) {
  response.set("X-Content-Type-Options", "nosniff");
  response.set("X-Frame-Options", "DENY");
  response.set("X-XSS-Protection", "1; mode=block");
  response.set("Referrer-Policy", "strict-origin-when-cross-origin");
  response.set("Permissions-Policy", "geolocation=(), microphone=(), camera=()");
  response.set("Content-Security-Policy", kContentSecurityPolicy);
}

std::string generateRequestId() {
  thread_local std::mt19937_64 gen(std::random_device{}());
  std::uniform_int_distribution<std::uint64_t> dis;

  std::ostringstream ss;
  ss << std::hex << std::setfill('0') << std::setw(16) << dis(gen)
     << std::setw(16) << dis(gen);
  return ss.str();
}

Middleware securityHeaders() {
  return [](Handler next) -> Handler {
    return [next = std::move(next)](const HttpRequest &request,
                                    RequestContext &context) {
      HttpResponse response = next(request, context);
      applySecurityHeaders(response);
      return response;
    };
  };
}

Middleware requestId() {
  return [](Handler next) -> Handler {
    return [next = std::move(next)](const HttpRequest &request,
                                    RequestContext &context) {
      const auto incoming = headerValue(request, "X-Request-ID");
      context.requestId = isAcceptableRequestId(incoming)
                              ? std::string(incoming)
                              : generateRequestId();

      HttpResponse response = next(request, context);
      response.set("X-Request-ID", context.requestId);
      return response;
    };
  };
}

Middleware rateLimit(std::shared_ptr<RateLimiter> limiter) {
  return [limiter = std::move(limiter)](Handler next) -> Handler {
    return [limiter, next = std::move(next)](const HttpRequest &request,
                                             RequestContext &context) {
      const std::string clientId =
          RateLimiter::extractClientId(request, context.remoteAddress);
      const RateLimitDecision decision = limiter->allow(clientId);

      if (!decision.allowed) {
        HttpResponse response = SecureHttpBoundary::errorResponse(
            ErrorCode::RATE_LIMIT_EXCEEDED, "rate limit exceeded");
        response.set(http::field::retry_after,
                     std::to_string(decision.retryAfter.count()));
        response.set("X-RateLimit-Limit", std::to_string(decision.limit));
        response.set("X-RateLimit-Remaining", "0");
        return response;
      }

      HttpResponse response = next(request, context);
      response.set("X-RateLimit-Limit", std::to_string(decision.limit));
      response.set("X-RateLimit-Remaining", std::to_string(decision.remaining));
      return response;
    };
  };
}

Middleware inputSanity() {
  return [](Handler next) -> Handler {
    return [next = std::move(next)](const HttpRequest &request,
                                    RequestContext &context) {
      if (isHealthPath(targetPath(requestTarget(request)))) {
        return next(request, context);
      }

      const auto userAgent = headerValue(request, "User-Agent");
      if (!userAgent.empty() && PatternDetector::isSuspicious(userAgent)) {
        SECURITY_LOG_WARN("Rejected request {} with suspicious User-Agent",
                          context.requestId);
        return SecureHttpBoundary::errorResponse(ErrorCode::INVALID_INPUT,
                                                 "invalid user agent");
      }

      const auto referer = headerValue(request, "Referer");
      if (!referer.empty() && PatternDetector::isSuspicious(referer)) {
        SECURITY_LOG_WARN("Rejected request {} with suspicious Referer",
                          context.requestId);
        return SecureHttpBoundary::errorResponse(ErrorCode::INVALID_INPUT,
                                                 "invalid referer");
      }

      return next(request, context);
    };
  };
}

Middleware apiKey(std::string expectedKey) {
  return [expectedKey = std::move(expectedKey)](Handler next) -> Handler {
    return [expectedKey, next = std::move(next)](const HttpRequest &request,
                                                 RequestContext &context) {
      const auto path = targetPath(requestTarget(request));
      if (!string_utils::starts_with(path, "/api/")) {
        return next(request, context);
      }

      const auto presented = headerValue(request, "X-API-Key");
      auto error = FieldValidator::validateApiKey(presented);
      if (error || !constantTimeEquals(presented, expectedKey)) {
        SECURITY_LOG_WARN("Rejected request {}: {}", context.requestId,
                          error ? error->message() : "API key mismatch");
        return SecureHttpBoundary::errorResponse(ErrorCode::UNAUTHORIZED,
                                                 "unauthorized");
      }

      return next(request, context);
    };
  };
}

} // namespace middleware

} // namespace ledgerguard
