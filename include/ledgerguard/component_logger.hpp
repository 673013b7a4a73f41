#pragma once

#include "ledgerguard/logger.hpp"
#include "ledgerguard/string_hash.hpp"
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace ledgerguard {

template <typename Component> struct ComponentTrait;

template <> struct ComponentTrait<class ConfigManager> {
  static constexpr const char *name = "ConfigManager";
};

template <> struct ComponentTrait<class HttpServer> {
  static constexpr const char *name = "HttpServer";
};

template <> struct ComponentTrait<class RateLimiter> {
  static constexpr const char *name = "RateLimiter";
};

template <> struct ComponentTrait<class SecureHttpBoundary> {
  static constexpr const char *name = "SecureHttpBoundary";
};

template <> struct ComponentTrait<class RequestValidator> {
  static constexpr const char *name = "RequestValidator";
};

template <> struct ComponentTrait<class Router> {
  static constexpr const char *name = "Router";
};

/**
 * ComponentLogger - compile-time component naming on top of Logger.
 *
 * Messages may carry `{}` placeholders that are filled from the trailing
 * arguments in order.
 */
template <typename Component> class ComponentLogger {
private:
  static_assert(std::is_class_v<Component>, "Component must be a class type");

  static constexpr const char *component_name = ComponentTrait<Component>::name;

  static Logger &getLogger() { return Logger::getInstance(); }

public:
  template <typename... Args>
  static void debug(const std::string &message, Args &&...args) {
    getLogger().debug(component_name,
                      format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void info(const std::string &message, Args &&...args) {
    getLogger().info(component_name,
                     format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void warn(const std::string &message, Args &&...args) {
    getLogger().warn(component_name,
                     format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void error(const std::string &message, Args &&...args) {
    getLogger().error(component_name,
                      format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void fatal(const std::string &message, Args &&...args) {
    getLogger().fatal(component_name,
                      format_message(message, std::forward<Args>(args)...));
  }

  static void warnWithContext(const std::string &message,
                              const LogContext &context) {
    getLogger().warn(component_name, message, context);
  }

  static void infoWithContext(const std::string &message,
                              const LogContext &context) {
    getLogger().info(component_name, message, context);
  }

  static constexpr const char *getComponentName() { return component_name; }

  template <typename... Args>
  static std::string format_message(const std::string &format,
                                    Args &&...args) {
    if constexpr (sizeof...(args) == 0) {
      return format;
    } else {
      std::stringstream ss;
      format_impl(ss, format, std::forward<Args>(args)...);
      return ss.str();
    }
  }

private:
  template <typename T>
  static void stream_value(std::stringstream &ss, T &&value) {
    if constexpr (std::is_arithmetic_v<std::decay_t<T>> ||
                  std::is_convertible_v<T, std::string_view>) {
      ss << std::forward<T>(value);
    } else {
      ss << "[object]";
    }
  }

  template <typename T, typename... Args>
  static void format_impl(std::stringstream &ss, const std::string &format,
                          T &&arg, Args &&...args) {
    size_t pos = format.find("{}");
    if (pos == std::string::npos) {
      ss << format;
      return;
    }
    ss << format.substr(0, pos);
    stream_value(ss, std::forward<T>(arg));
    if constexpr (sizeof...(args) > 0) {
      format_impl(ss, format.substr(pos + 2), std::forward<Args>(args)...);
    } else {
      ss << format.substr(pos + 2);
    }
  }
};

using ConfigLogger = ComponentLogger<class ConfigManager>;
using HttpLogger = ComponentLogger<class HttpServer>;
using RateLimiterLogger = ComponentLogger<class RateLimiter>;
using BoundaryLogger = ComponentLogger<class SecureHttpBoundary>;
using ValidationLogger = ComponentLogger<class RequestValidator>;
using RouterLogger = ComponentLogger<class Router>;

} // namespace ledgerguard

#define CONFIG_LOG_DEBUG(message, ...)                                         \
  ::ledgerguard::ConfigLogger::debug(message, ##__VA_ARGS__)
#define CONFIG_LOG_INFO(message, ...)                                          \
  ::ledgerguard::ConfigLogger::info(message, ##__VA_ARGS__)
#define CONFIG_LOG_WARN(message, ...)                                          \
  ::ledgerguard::ConfigLogger::warn(message, ##__VA_ARGS__)
#define CONFIG_LOG_ERROR(message, ...)                                         \
  ::ledgerguard::ConfigLogger::error(message, ##__VA_ARGS__)

#define HTTP_LOG_DEBUG(message, ...)                                           \
  ::ledgerguard::HttpLogger::debug(message, ##__VA_ARGS__)
#define HTTP_LOG_INFO(message, ...)                                            \
  ::ledgerguard::HttpLogger::info(message, ##__VA_ARGS__)
#define HTTP_LOG_WARN(message, ...)                                            \
  ::ledgerguard::HttpLogger::warn(message, ##__VA_ARGS__)
#define HTTP_LOG_ERROR(message, ...)                                           \
  ::ledgerguard::HttpLogger::error(message, ##__VA_ARGS__)

#define RATE_LOG_DEBUG(message, ...)                                           \
  ::ledgerguard::RateLimiterLogger::debug(message, ##__VA_ARGS__)
#define RATE_LOG_INFO(message, ...)                                            \
  ::ledgerguard::RateLimiterLogger::info(message, ##__VA_ARGS__)
#define RATE_LOG_WARN(message, ...)                                            \
  ::ledgerguard::RateLimiterLogger::warn(message, ##__VA_ARGS__)

#define SECURITY_LOG_DEBUG(message, ...)                                       \
  ::ledgerguard::BoundaryLogger::debug(message, ##__VA_ARGS__)
#define SECURITY_LOG_INFO(message, ...)                                        \
  ::ledgerguard::BoundaryLogger::info(message, ##__VA_ARGS__)
#define SECURITY_LOG_WARN(message, ...)                                        \
  ::ledgerguard::BoundaryLogger::warn(message, ##__VA_ARGS__)
#define SECURITY_LOG_ERROR(message, ...)                                       \
  ::ledgerguard::BoundaryLogger::error(message, ##__VA_ARGS__)
