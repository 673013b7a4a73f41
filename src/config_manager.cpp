#include "ledgerguard/config_manager.hpp"
#include "ledgerguard/exceptions.hpp"
#include "ledgerguard/string_utils.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace ledgerguard {

namespace {

constexpr int kMaxNestingDepth = 32;

} // namespace

ConfigManager &ConfigManager::getInstance() {
  static ConfigManager instance;
  return instance;
}

bool ConfigManager::loadConfig(const std::string &configPath) {
  CONFIG_LOG_INFO("Loading configuration from: {}", configPath);

  std::ifstream file(configPath);
  if (!file.is_open()) {
    CONFIG_LOG_ERROR("Cannot open config file: {}", configPath);
    return false;
  }

  nlohmann::json document;
  try {
    file >> document;
  } catch (const nlohmann::json::parse_error &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON config file {}: {}", configPath,
                     e.what());
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    configFilePath_ = configPath;
  }
  return parseJson(document);
}

bool ConfigManager::loadFromString(const std::string &jsonText) {
  nlohmann::json document =
      nlohmann::json::parse(jsonText, nullptr, /*allow_exceptions=*/false);
  if (document.is_discarded()) {
    CONFIG_LOG_ERROR("Failed to parse JSON configuration text");
    return false;
  }
  return parseJson(document);
}

bool ConfigManager::parseJson(const nlohmann::json &document) {
  if (!document.is_object()) {
    CONFIG_LOG_ERROR("Configuration root must be a JSON object");
    return false;
  }

  std::size_t parameters = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    configData_.clear();
    flattenJson(document, "", 0);
    parameters = configData_.size();
  }

  CONFIG_LOG_INFO("Configuration loaded successfully with {} parameters",
                  parameters);
  return true;
}

// Caller holds mutex_
void ConfigManager::flattenJson(const nlohmann::json &json,
                                const std::string &prefix, int depth) {
  if (depth >= kMaxNestingDepth) {
    configData_[prefix] = json.dump();
    return;
  }

  for (auto it = json.begin(); it != json.end(); ++it) {
    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

    if (it->is_object()) {
      flattenJson(*it, key, depth + 1);
    } else if (it->is_string()) {
      configData_[key] = it->get<std::string>();
    } else if (it->is_boolean()) {
      configData_[key] = it->get<bool>() ? "true" : "false";
    } else if (it->is_number_integer()) {
      configData_[key] = std::to_string(it->get<long long>());
    } else {
      // Arrays, floats and null keep their JSON text
      configData_[key] = it->dump();
    }
  }
}

void ConfigManager::applyEnvironmentOverrides() {
  if (const char *address = std::getenv("HTTP_ADDRESS");
      address != nullptr && *address != '\0') {
    applyHttpAddress(address);
    CONFIG_LOG_INFO("Listen address overridden by HTTP_ADDRESS: {}", address);
  }

  if (const char *apiKey = std::getenv("API_KEY");
      apiKey != nullptr && *apiKey != '\0') {
    set("security.api_key", apiKey);
    CONFIG_LOG_INFO("API key overridden by API_KEY");
  }
}

void ConfigManager::applyHttpAddress(std::string_view hostPort) {
  auto colon = hostPort.rfind(':');
  if (colon == std::string_view::npos || colon + 1 == hostPort.size()) {
    throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                          "HTTP_ADDRESS must have the form host:port",
                          "ConfigManager",
                          {{"value", std::string(hostPort)}});
  }

  auto host = hostPort.substr(0, colon);
  auto port = string_utils::to_integer<int>(hostPort.substr(colon + 1));
  if (!port.success || port.value <= 0 || port.value > 65535) {
    throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                          "HTTP_ADDRESS has an invalid port", "ConfigManager",
                          {{"value", std::string(hostPort)}});
  }

  // ":8080" keeps the configured host
  if (!host.empty()) {
    set("server.address", std::string(host));
  }
  set("server.port", std::to_string(port.value));
}

void ConfigManager::set(const std::string &key, const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  configData_[key] = value;
}

std::string ConfigManager::getString(const std::string &key,
                                     const std::string &defaultValue) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
    return it->second;
  }
  return defaultValue;
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  std::string raw = getString(key);
  if (raw.empty()) {
    return defaultValue;
  }
  auto parsed = string_utils::to_integer<int>(raw);
  if (!parsed.success) {
    CONFIG_LOG_WARN("Config key {} is not an integer: {}", key, raw);
    return defaultValue;
  }
  return parsed.value;
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  std::string raw = getString(key);
  if (raw.empty()) {
    return defaultValue;
  }
  std::string value = string_utils::to_lower(raw);
  return value == "true" || value == "1" || value == "yes" || value == "on";
}

StringSet ConfigManager::getStringSet(const std::string &key) const {
  StringSet result;
  std::string raw = getString(key);
  if (raw.empty()) {
    return result;
  }

  if (raw.front() == '[') {
    auto array = nlohmann::json::parse(raw, nullptr, false);
    if (array.is_array()) {
      for (const auto &item : array) {
        if (item.is_string()) {
          result.insert(item.get<std::string>());
        }
      }
      return result;
    }
  }

  // Comma separated form, e.g. from an environment value
  for (auto item : string_utils::split_view(raw, ',')) {
    item = string_utils::trim(item);
    if (!item.empty()) {
      result.emplace(item);
    }
  }
  return result;
}

bool ConfigManager::hasKey(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return configData_.find(key) != configData_.end();
}

LogConfig ConfigManager::getLoggingConfig() const {
  LogConfig config;

  config.level = parseLogLevel(getString("logging.level", "INFO"));
  config.format = parseLogFormat(getString("logging.format", "TEXT"));
  config.consoleOutput = getBool("logging.console_output", true);
  config.fileOutput = getBool("logging.file_output", false);
  config.asyncLogging = getBool("logging.async_logging", false);
  config.logFile = getString("logging.log_file", "logs/ledgerguard.log");
  config.maxFileSize =
      static_cast<size_t>(getInt("logging.max_file_size", 10485760));
  config.maxBackupFiles = getInt("logging.max_backup_files", 5);
  config.enableRotation = getBool("logging.enable_rotation", true);
  config.componentFilter = getStringSet("logging.component_filter");

  return config;
}

namespace {

template <typename Section>
Section validatedSection(Section section, const char *name) {
  auto result = section.validate();
  for (const auto &warning : result.warnings) {
    CONFIG_LOG_WARN("{} config: {}", name, warning);
  }
  if (!result.isValid) {
    for (const auto &error : result.errors) {
      CONFIG_LOG_ERROR("{} config: {}", name, error);
    }
    section.applyDefaults();
  }
  return section;
}

} // namespace

ServerConfig ConfigManager::getServerConfig() const {
  return validatedSection(ServerConfig::fromConfig(*this), "server");
}

SecurityConfig ConfigManager::getSecurityConfig() const {
  return validatedSection(SecurityConfig::fromConfig(*this), "security");
}

ConfigValidationResult ConfigManager::validateConfiguration() const {
  ConfigValidationResult result;

  for (const auto &section : {ServerConfig::fromConfig(*this).validate(),
                              SecurityConfig::fromConfig(*this).validate()}) {
    result.isValid = result.isValid && section.isValid;
    result.errors.insert(result.errors.end(), section.errors.begin(),
                         section.errors.end());
    result.warnings.insert(result.warnings.end(), section.warnings.begin(),
                           section.warnings.end());
  }

  return result;
}

LogLevel ConfigManager::parseLogLevel(const std::string &levelStr) {
  std::string level = levelStr;
  std::transform(level.begin(), level.end(), level.begin(), ::toupper);

  if (level == "DEBUG")
    return LogLevel::DEBUG;
  if (level == "INFO")
    return LogLevel::INFO;
  if (level == "WARN" || level == "WARNING")
    return LogLevel::WARN;
  if (level == "ERROR")
    return LogLevel::ERROR;
  if (level == "FATAL")
    return LogLevel::FATAL;

  return LogLevel::INFO;
}

LogFormat ConfigManager::parseLogFormat(const std::string &formatStr) {
  return string_utils::iequals(formatStr, "JSON") ? LogFormat::JSON
                                                  : LogFormat::TEXT;
}

// ===== Server section =====

ServerConfig ServerConfig::fromConfig(const ConfigManager &config) {
  ServerConfig server;

  server.address = config.getString("server.address", server.address);
  server.port = config.getInt("server.port", server.port);
  server.threads = config.getInt("server.threads", server.threads);
  server.requestTimeout = std::chrono::seconds(
      config.getInt("server.request_timeout_seconds",
                    static_cast<int>(server.requestTimeout.count())));

  return server;
}

ConfigValidationResult ServerConfig::validate() const {
  ConfigValidationResult result;

  if (address.empty()) {
    result.addError("Server address cannot be empty");
  }

  if (port <= 0 || port > 65535) {
    std::stringstream ss;
    ss << "Server port must be between 1 and 65535, got: " << port;
    result.addError(ss.str());
  } else if (port < 1024) {
    std::stringstream ss;
    ss << "Server port " << port << " is in privileged range (< 1024)";
    result.addWarning(ss.str());
  }

  if (threads <= 0) {
    std::stringstream ss;
    ss << "Server threads must be positive, got: " << threads;
    result.addError(ss.str());
  } else if (threads > 256) {
    std::stringstream ss;
    ss << "Server threads is very high (" << threads
       << "), this may cause resource issues";
    result.addWarning(ss.str());
  }

  if (requestTimeout.count() <= 0) {
    std::stringstream ss;
    ss << "Server request_timeout_seconds must be positive, got: "
       << requestTimeout.count();
    result.addError(ss.str());
  }

  return result;
}

void ServerConfig::applyDefaults() {
  const ServerConfig defaults;
  if (address.empty())
    address = defaults.address;
  if (port <= 0 || port > 65535)
    port = defaults.port;
  if (threads <= 0)
    threads = defaults.threads;
  if (requestTimeout.count() <= 0)
    requestTimeout = defaults.requestTimeout;
}

// ===== Security section =====

SecurityConfig SecurityConfig::fromConfig(const ConfigManager &config) {
  SecurityConfig security;

  int maxBody = config.getInt("security.max_body_bytes",
                              static_cast<int>(security.maxBodyBytes));
  security.maxBodyBytes = maxBody > 0 ? static_cast<std::size_t>(maxBody) : 0;

  auto &rate = security.rateLimit;
  rate.requestsPerWindow = config.getInt(
      "security.rate_limit.requests_per_minute", rate.requestsPerWindow);
  rate.window = std::chrono::seconds(
      config.getInt("security.rate_limit.window_seconds",
                    static_cast<int>(rate.window.count())));
  rate.idleTtl = std::chrono::seconds(
      config.getInt("security.rate_limit.idle_ttl_seconds",
                    static_cast<int>(rate.idleTtl.count())));
  int maxClients =
      config.getInt("security.rate_limit.max_tracked_clients",
                    static_cast<int>(rate.maxTrackedClients));
  rate.maxTrackedClients =
      maxClients > 0 ? static_cast<std::size_t>(maxClients) : 0;

  security.apiKey = config.getString("security.api_key");

  return security;
}

ConfigValidationResult SecurityConfig::validate() const {
  ConfigValidationResult result;

  if (maxBodyBytes == 0) {
    result.addError("Security max_body_bytes must be positive");
  } else if (maxBodyBytes > limits::kMaxRequestBodyBytes) {
    std::stringstream ss;
    ss << "Security max_body_bytes (" << maxBodyBytes
       << ") exceeds the recommended " << limits::kMaxRequestBodyBytes;
    result.addWarning(ss.str());
  }

  if (rateLimit.requestsPerWindow <= 0) {
    std::stringstream ss;
    ss << "Rate limit requests_per_minute must be positive, got: "
       << rateLimit.requestsPerWindow;
    result.addError(ss.str());
  }

  if (rateLimit.window.count() <= 0) {
    std::stringstream ss;
    ss << "Rate limit window_seconds must be positive, got: "
       << rateLimit.window.count();
    result.addError(ss.str());
  }

  if (rateLimit.idleTtl.count() < 0) {
    std::stringstream ss;
    ss << "Rate limit idle_ttl_seconds cannot be negative, got: "
       << rateLimit.idleTtl.count();
    result.addError(ss.str());
  }

  if (rateLimit.maxTrackedClients == 0) {
    result.addError("Rate limit max_tracked_clients must be positive");
  }

  if (!apiKey.empty() && (apiKey.size() < limits::kMinApiKeyLength ||
                          apiKey.size() > limits::kMaxApiKeyLength)) {
    std::stringstream ss;
    ss << "Security api_key must be between " << limits::kMinApiKeyLength
       << " and " << limits::kMaxApiKeyLength << " characters";
    result.addError(ss.str());
  }

  return result;
}

void SecurityConfig::applyDefaults() {
  const SecurityConfig defaults;
  if (maxBodyBytes == 0)
    maxBodyBytes = defaults.maxBodyBytes;
  if (rateLimit.requestsPerWindow <= 0)
    rateLimit.requestsPerWindow = defaults.rateLimit.requestsPerWindow;
  if (rateLimit.window.count() <= 0)
    rateLimit.window = defaults.rateLimit.window;
  if (rateLimit.idleTtl.count() < 0)
    rateLimit.idleTtl = defaults.rateLimit.idleTtl;
  if (rateLimit.maxTrackedClients == 0)
    rateLimit.maxTrackedClients = defaults.rateLimit.maxTrackedClients;
  // An out-of-bounds api_key is kept: every API request then fails with 401
}

} // namespace ledgerguard
