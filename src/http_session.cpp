#include "ledgerguard/http_session.hpp"
#include "ledgerguard/logger.hpp"
#include "ledgerguard/secure_http.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/core/ignore_unused.hpp>
#include <utility>

namespace ledgerguard {

HttpSession::HttpSession(tcp::socket &&socket, Handler handler,
                         std::size_t maxBodyBytes,
                         std::chrono::seconds requestTimeout)
    : stream_(std::move(socket)), handler_(std::move(handler)),
      maxBodyBytes_(maxBodyBytes), requestTimeout_(requestTimeout) {
  beast::error_code ec;
  auto endpoint = stream_.socket().remote_endpoint(ec);
  if (!ec) {
    remoteAddress_ = endpoint.address().to_string();
  }
}

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::doRead,
                                          shared_from_this()));
}

void HttpSession::doRead() {
  // A parser handles exactly one message
  parser_.emplace();
  SecureHttpBoundary::applyBodyLimit(*parser_, maxBodyBytes_);

  stream_.expires_after(requestTimeout_);

  http::async_read(stream_, buffer_, *parser_,
                   beast::bind_front_handler(&HttpSession::onRead,
                                             shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t bytesTransferred) {
  boost::ignore_unused(bytesTransferred);

  if (ec == http::error::end_of_stream) {
    return doClose();
  }

  if (ec == http::error::body_limit) {
    HTTP_LOG_WARN("Request body from {} exceeds {} bytes, closing",
                  remoteAddress_, maxBodyBytes_);
    auto response = SecureHttpBoundary::payloadTooLargeResponse();
    response.keep_alive(false);
    response.prepare_payload();
    return sendResponse(std::move(response));
  }

  if (ec == beast::error::timeout) {
    HTTP_LOG_DEBUG("Read timeout for {}, closing", remoteAddress_);
    return doClose();
  }

  if (ec) {
    HTTP_LOG_DEBUG("Read error from {}: {}", remoteAddress_, ec.message());
    return doClose();
  }

  HttpRequest request = parser_->release();
  HTTP_LOG_DEBUG("Processing request: {} {}", verbName(request.method()),
                 std::string(requestTarget(request)));

  HttpResponse response = handleRequest(request);
  response.version(request.version());
  if (!request.keep_alive()) {
    response.keep_alive(false);
  }
  response.prepare_payload();
  sendResponse(std::move(response));
}

HttpResponse HttpSession::handleRequest(const HttpRequest &request) {
  RequestContext context;
  context.remoteAddress = remoteAddress_;

  try {
    return handler_(request, context);
  } catch (const std::exception &e) {
    HTTP_LOG_ERROR("Unhandled exception in handler chain: {}", e.what());
    return SecureHttpBoundary::errorResponse(ErrorCode::INTERNAL_ERROR,
                                             "internal server error");
  }
}

void HttpSession::sendResponse(HttpResponse &&response) {
  auto message = std::make_shared<HttpResponse>(std::move(response));
  auto self = shared_from_this();

  http::async_write(stream_, *message,
                    [self, message](beast::error_code ec,
                                    std::size_t bytesTransferred) {
                      self->onWrite(message->need_eof(), ec,
                                    bytesTransferred);
                    });
}

void HttpSession::onWrite(bool close, beast::error_code ec,
                          std::size_t bytesTransferred) {
  boost::ignore_unused(bytesTransferred);

  if (ec) {
    HTTP_LOG_DEBUG("Write error to {}: {}", remoteAddress_, ec.message());
    return doClose();
  }

  if (close) {
    return doClose();
  }

  doRead();
}

void HttpSession::doClose() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  if (ec && ec != net::error::not_connected) {
    HTTP_LOG_DEBUG("Shutdown error: {}", ec.message());
  }
}

} // namespace ledgerguard
