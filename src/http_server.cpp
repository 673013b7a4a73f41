#include "ledgerguard/http_server.hpp"
#include "ledgerguard/exceptions.hpp"
#include "ledgerguard/http_session.hpp"
#include "ledgerguard/logger.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <algorithm>
#include <string>
#include <thread>
#include <vector>

namespace ledgerguard {

namespace {

class Listener : public std::enable_shared_from_this<Listener> {
public:
  Listener(net::io_context &ioc, tcp::endpoint endpoint, Handler handler,
           std::size_t maxBodyBytes, std::chrono::seconds requestTimeout)
      : ioc_(ioc), acceptor_(net::make_strand(ioc)),
        handler_(std::move(handler)), maxBodyBytes_(maxBodyBytes),
        requestTimeout_(requestTimeout) {
    beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      fail(ec, "open");
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
      fail(ec, "set_option");
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      fail(ec, "bind");
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
      fail(ec, "listen");
    }
  }

  void run() { doAccept(); }

  unsigned short localPort() const {
    beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

  void close() {
    beast::error_code ec;
    acceptor_.close(ec);
  }

private:
  net::io_context &ioc_;
  tcp::acceptor acceptor_;
  Handler handler_;
  std::size_t maxBodyBytes_;
  std::chrono::seconds requestTimeout_;

  [[noreturn]] static void fail(beast::error_code ec, const char *what) {
    throw SystemException(ErrorCode::NETWORK_ERROR,
                          std::string(what) + ": " + ec.message(),
                          "HttpServer");
  }

  void doAccept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&Listener::onAccept, shared_from_this()));
  }

  void onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
      if (ec == net::error::operation_aborted ||
          ec == net::error::bad_descriptor) {
        HTTP_LOG_DEBUG("Listener stopped: {}", ec.message());
        return;
      }
      HTTP_LOG_WARN("Accept error, continuing: {}", ec.message());
    } else {
      std::make_shared<HttpSession>(std::move(socket), handler_,
                                    maxBodyBytes_, requestTimeout_)
          ->run();
    }

    doAccept();
  }
};

} // namespace

struct HttpServer::Impl {
  ServerConfig config;
  std::size_t maxBodyBytes = 0;
  Handler handler;
  std::unique_ptr<net::io_context> ioc;
  std::shared_ptr<Listener> listener;
  std::vector<std::thread> threadPool;
  bool running = false;
};

HttpServer::HttpServer(const ServerConfig &config, std::size_t maxBodyBytes)
    : pImpl(std::make_unique<Impl>()) {
  pImpl->config = config;
  pImpl->maxBodyBytes = maxBodyBytes;

  auto validation = pImpl->config.validate();
  if (!validation.isValid) {
    for (const auto &error : validation.errors) {
      HTTP_LOG_ERROR("Invalid server configuration: {}", error);
    }
    pImpl->config.applyDefaults();
    HTTP_LOG_INFO("Applied default values for invalid server configuration");
  }
}

HttpServer::~HttpServer() { stop(); }

void HttpServer::setHandler(Handler handler) {
  pImpl->handler = std::move(handler);
}

void HttpServer::start() {
  if (pImpl->running) {
    HTTP_LOG_WARN("HTTP server already running");
    return;
  }

  if (!pImpl->handler) {
    throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                          "No request handler set", "HttpServer");
  }

  const auto &config = pImpl->config;
  HTTP_LOG_INFO("Starting HTTP server on {}:{}", config.address, config.port);

  beast::error_code ec;
  auto address = net::ip::make_address(config.address, ec);
  if (ec) {
    throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                          "Invalid listen address: " + config.address,
                          "HttpServer", {{"error", ec.message()}});
  }

  int threads = std::max(1, config.threads);
  pImpl->ioc = std::make_unique<net::io_context>(threads);

  try {
    pImpl->listener = std::make_shared<Listener>(
        *pImpl->ioc,
        tcp::endpoint{address, static_cast<unsigned short>(config.port)},
        pImpl->handler, pImpl->maxBodyBytes, config.requestTimeout);
  } catch (const SystemException &e) {
    HTTP_LOG_ERROR("Failed to start listener: {}", e.getMessage());
    pImpl->ioc.reset();
    throw SystemException(ErrorCode::SERVICE_STARTUP_FAILED, e.getMessage(),
                          "HttpServer", e.getContext());
  }
  pImpl->listener->run();

  pImpl->threadPool.reserve(threads);
  for (int i = 0; i < threads; ++i) {
    pImpl->threadPool.emplace_back([this, i]() {
      try {
        pImpl->ioc->run();
      } catch (const std::exception &e) {
        HTTP_LOG_ERROR("HttpServer thread {} exception: {}", i, e.what());
      }
    });
  }

  pImpl->running = true;
  HTTP_LOG_INFO("HTTP server started with {} threads on port {}", threads,
                boundPort());
}

void HttpServer::stop() {
  if (!pImpl->running) {
    return;
  }

  HTTP_LOG_INFO("Stopping HTTP server");

  pImpl->ioc->stop();

  for (auto &t : pImpl->threadPool) {
    if (t.joinable()) {
      t.join();
    }
  }
  pImpl->threadPool.clear();

  if (pImpl->listener) {
    pImpl->listener->close();
    pImpl->listener.reset();
  }

  pImpl->running = false;
  HTTP_LOG_INFO("HTTP server stopped");
}

bool HttpServer::isRunning() const { return pImpl->running; }

unsigned short HttpServer::boundPort() const {
  return pImpl->listener ? pImpl->listener->localPort() : 0;
}

const ServerConfig &HttpServer::getServerConfig() const {
  return pImpl->config;
}

} // namespace ledgerguard
