#pragma once

#include "ledgerguard/config_manager.hpp"
#include "ledgerguard/middleware.hpp"
#include <cstddef>
#include <memory>

namespace ledgerguard {

/**
 * @brief Multi-threaded HTTP listener that feeds every request through one
 * handler chain.
 *
 * start() throws SystemException when no handler is set or the address
 * cannot be parsed or bound.
 */
class HttpServer {
public:
  HttpServer(const ServerConfig &config, std::size_t maxBodyBytes);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  void setHandler(Handler handler);

  void start();
  void stop();
  bool isRunning() const;

  // Port the acceptor is bound to, 0 before start()
  unsigned short boundPort() const;

  const ServerConfig &getServerConfig() const;

private:
  struct Impl;
  std::unique_ptr<Impl> pImpl;
};

} // namespace ledgerguard
