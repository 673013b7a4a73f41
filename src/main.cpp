#include "ledgerguard/api_routes.hpp"
#include "ledgerguard/config_manager.hpp"
#include "ledgerguard/exceptions.hpp"
#include "ledgerguard/http_server.hpp"
#include "ledgerguard/logger.hpp"
#include "ledgerguard/middleware.hpp"
#include "ledgerguard/rate_limiter.hpp"
#include "ledgerguard/router.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace ledgerguard;

namespace {

std::string resolveConfigPath(int argc, char *argv[]) {
  if (argc > 1) {
    return argv[1];
  }
  if (const char *env = std::getenv("LEDGERGUARD_CONFIG");
      env != nullptr && *env != '\0') {
    return env;
  }
  return "config.json";
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    auto &config = ConfigManager::getInstance();
    const std::string configPath = resolveConfigPath(argc, argv);
    if (!config.loadConfig(configPath)) {
      throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                            "Failed to load configuration", "Main",
                            {{"path", configPath}});
    }
    config.applyEnvironmentOverrides();

    Logger::getInstance().configure(config.getLoggingConfig());
    LEDGERGUARD_LOG_INFO("Main", "Starting LedgerGuard request boundary");

    const ServerConfig serverConfig = config.getServerConfig();
    const SecurityConfig securityConfig = config.getSecurityConfig();

    auto limiter = std::make_shared<RateLimiter>(securityConfig.rateLimit);

    Router router;
    registerHealthRoutes(router);
    registerApiRoutes(router, std::make_shared<EchoRequestSink>());
    LEDGERGUARD_LOG_INFO("Main", "Registered " +
                                     std::to_string(router.routeCount()) +
                                     " routes");

    std::vector<Middleware> middlewares{
        middleware::securityHeaders(), middleware::requestId(),
        middleware::rateLimit(limiter), middleware::inputSanity()};
    if (!securityConfig.apiKey.empty()) {
      middlewares.push_back(middleware::apiKey(securityConfig.apiKey));
      LEDGERGUARD_LOG_INFO("Main", "API key authentication enabled");
    }

    HttpServer server(serverConfig, securityConfig.maxBodyBytes);
    server.setHandler(buildChain(router.asHandler(), middlewares));
    server.start();

    boost::asio::io_context signalContext;
    boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
    signals.async_wait([&server](const boost::system::error_code &ec,
                                 int signal) {
      if (ec) {
        return;
      }
      LEDGERGUARD_LOG_INFO("Main", "Received signal " +
                                       std::to_string(signal) +
                                       ". Shutting down gracefully...");
      server.stop();
    });
    signalContext.run();

    Logger::getInstance().flush();
    return 0;
  } catch (const SystemException &e) {
    LEDGERGUARD_LOG_FATAL("Main", e.toLogString());
    std::cerr << "Fatal: " << e.getMessage() << std::endl;
    Logger::getInstance().flush();
    return 1;
  } catch (const std::exception &e) {
    LEDGERGUARD_LOG_FATAL("Main", std::string("Unhandled exception: ") +
                                      e.what());
    std::cerr << "Fatal: " << e.what() << std::endl;
    Logger::getInstance().flush();
    return 1;
  }
}
