#pragma once

#include <boost/beast/http.hpp>
#include <string>
#include <string_view>

namespace ledgerguard {

namespace beast = boost::beast;
namespace http = beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

inline std::string verbName(http::verb method) {
  auto name = http::to_string(method);
  return std::string(name.data(), name.size());
}

// Request target without its query string
inline std::string_view targetPath(std::string_view target) {
  return target.substr(0, target.find('?'));
}

inline std::string_view requestTarget(const HttpRequest &request) {
  auto target = request.target();
  return std::string_view(target.data(), target.size());
}

// Value of a request header, empty when absent
inline std::string_view headerValue(const HttpRequest &request,
                                    std::string_view name) {
  auto it = request.find(beast::string_view(name.data(), name.size()));
  if (it == request.end()) {
    return {};
  }
  auto value = it->value();
  return std::string_view(value.data(), value.size());
}

} // namespace ledgerguard
