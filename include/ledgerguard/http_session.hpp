#pragma once

#include "ledgerguard/http_types.hpp"
#include "ledgerguard/middleware.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace ledgerguard {

namespace net = boost::asio;
using tcp = net::ip::tcp;

/**
 * One HTTP/1.1 connection. Reads requests through a size-capped parser, runs
 * the handler chain and writes the response, until the peer or the response
 * asks to close.
 *
 * A body over the cap is answered with 413 and the connection is closed. A
 * read timeout or reset closes the connection without a response.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket &&socket, Handler handler, std::size_t maxBodyBytes,
              std::chrono::seconds requestTimeout);

  void run();

private:
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  Handler handler_;
  std::size_t maxBodyBytes_;
  std::chrono::seconds requestTimeout_;
  std::string remoteAddress_;

  void doRead();
  void onRead(beast::error_code ec, std::size_t bytesTransferred);
  HttpResponse handleRequest(const HttpRequest &request);
  void sendResponse(HttpResponse &&response);
  void onWrite(bool close, beast::error_code ec, std::size_t bytesTransferred);
  void doClose();
};

} // namespace ledgerguard
