#pragma once

#include "ledgerguard/logger.hpp"
#include "ledgerguard/rate_limiter.hpp"
#include "ledgerguard/string_hash.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace ledgerguard {

class ConfigManager;

// Configuration validation result
struct ConfigValidationResult {
  bool isValid = true;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  void addError(const std::string &error) {
    isValid = false;
    errors.push_back(error);
  }

  void addWarning(const std::string &warning) { warnings.push_back(warning); }
};

// Listener and worker settings (server.*)
struct ServerConfig {
  std::string address = "0.0.0.0";
  int port = 8080;
  int threads = 4;
  std::chrono::seconds requestTimeout{30};

  static ServerConfig fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
  // Replaces invalid values with their defaults
  void applyDefaults();
};

// Boundary settings (security.*)
struct SecurityConfig {
  std::size_t maxBodyBytes = limits::kMaxRequestBodyBytes;
  RateLimiter::Options rateLimit;
  std::string apiKey; // empty disables the API key middleware

  static SecurityConfig fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
  void applyDefaults();
};

/**
 * @brief JSON configuration flattened to dot-separated keys.
 *
 * Nested objects become "section.key" entries; arrays are kept as their JSON
 * text. Environment overrides (HTTP_ADDRESS, API_KEY) are applied on top of
 * the loaded file by applyEnvironmentOverrides().
 */
class ConfigManager {
public:
  static ConfigManager &getInstance();

  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  bool loadConfig(const std::string &configPath);
  bool loadFromString(const std::string &jsonText);

  // Throws SystemException when HTTP_ADDRESS is not host:port
  void applyEnvironmentOverrides();
  void applyHttpAddress(std::string_view hostPort);
  void set(const std::string &key, const std::string &value);

  std::string getString(const std::string &key,
                        const std::string &defaultValue = "") const;
  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  StringSet getStringSet(const std::string &key) const;
  bool hasKey(const std::string &key) const;

  LogConfig getLoggingConfig() const;

  // Validated sections; errors are logged and the offending values defaulted
  ServerConfig getServerConfig() const;
  SecurityConfig getSecurityConfig() const;

  ConfigValidationResult validateConfiguration() const;

  const std::string &getConfigPath() const { return configFilePath_; }

private:
  ConfigManager() = default;

  StringMap<std::string> configData_;
  std::string configFilePath_;
  mutable std::mutex mutex_;

  bool parseJson(const nlohmann::json &document);
  void flattenJson(const nlohmann::json &json, const std::string &prefix,
                   int depth);
  static LogLevel parseLogLevel(const std::string &levelStr);
  static LogFormat parseLogFormat(const std::string &formatStr);
};

} // namespace ledgerguard
