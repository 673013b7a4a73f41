#pragma once

#include "ledgerguard/middleware.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace ledgerguard {

/**
 * @brief Method + path dispatch with `{name}` path parameters.
 *
 * Unknown paths answer 404 and known paths with another method answer 405.
 * Exceptions escaping a route handler are logged and answered with 500.
 */
class Router {
public:
  void addRoute(http::verb method, std::string pattern, Handler handler);

  HttpResponse dispatch(const HttpRequest &request,
                        RequestContext &context) const;

  // Handler view of this router; the router must outlive it
  Handler asHandler() const;

  std::size_t routeCount() const { return routes_.size(); }

private:
  struct Route {
    http::verb method;
    std::string pattern;
    std::vector<std::string> segments;
    Handler handler;
  };

  static std::vector<std::string_view> splitPath(std::string_view path);
  static bool matchSegments(const std::vector<std::string> &pattern,
                            const std::vector<std::string_view> &path,
                            StringMap<std::string> &params);

  std::vector<Route> routes_;
};

} // namespace ledgerguard
