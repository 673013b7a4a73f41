#include "ledgerguard/config_manager.hpp"
#include "ledgerguard/exceptions.hpp"
#include <gtest/gtest.h>

using namespace ledgerguard;

class ConfigManagerTest : public ::testing::Test {
protected:
  ConfigManager &config() { return ConfigManager::getInstance(); }

  void load(const std::string &json) {
    ASSERT_TRUE(config().loadFromString(json)) << json;
  }
};

TEST_F(ConfigManagerTest, FlattensNestedKeys) {
  load(R"({
    "server": {"address": "127.0.0.1", "port": 9000, "threads": 2},
    "security": {"rate_limit": {"requests_per_minute": 30}},
    "logging": {"console_output": false}
  })");

  EXPECT_EQ(config().getString("server.address"), "127.0.0.1");
  EXPECT_EQ(config().getInt("server.port"), 9000);
  EXPECT_EQ(config().getInt("security.rate_limit.requests_per_minute"), 30);
  EXPECT_FALSE(config().getBool("logging.console_output", true));
  EXPECT_TRUE(config().hasKey("server.threads"));
  EXPECT_FALSE(config().hasKey("server"));
}

TEST_F(ConfigManagerTest, MissingOrMalformedValuesUseDefaults) {
  load(R"({"server": {"port": "eighty"}})");

  EXPECT_EQ(config().getInt("server.port", 8080), 8080);
  EXPECT_EQ(config().getInt("server.threads", 4), 4);
  EXPECT_EQ(config().getString("server.address", "0.0.0.0"), "0.0.0.0");
  EXPECT_TRUE(config().getBool("logging.enable_rotation", true));
}

TEST_F(ConfigManagerTest, RejectsInvalidDocuments) {
  EXPECT_FALSE(config().loadFromString("not json"));
  EXPECT_FALSE(config().loadFromString("[1, 2, 3]"));
}

TEST_F(ConfigManagerTest, ServerSectionDefaults) {
  load("{}");

  auto server = config().getServerConfig();
  EXPECT_EQ(server.address, "0.0.0.0");
  EXPECT_EQ(server.port, 8080);
  EXPECT_EQ(server.threads, 4);
  EXPECT_EQ(server.requestTimeout, std::chrono::seconds(30));
}

TEST_F(ConfigManagerTest, InvalidServerValuesFallBackToDefaults) {
  load(R"({"server": {"address": "10.0.0.5", "port": 70000, "threads": 0,
                      "request_timeout_seconds": -1}})");

  auto raw = ServerConfig::fromConfig(config());
  auto validation = raw.validate();
  EXPECT_FALSE(validation.isValid);
  EXPECT_EQ(validation.errors.size(), 3u);

  auto server = config().getServerConfig();
  EXPECT_EQ(server.address, "10.0.0.5");
  EXPECT_EQ(server.port, 8080);
  EXPECT_EQ(server.threads, 4);
  EXPECT_EQ(server.requestTimeout, std::chrono::seconds(30));
}

TEST_F(ConfigManagerTest, PrivilegedPortIsOnlyAWarning) {
  load(R"({"server": {"port": 80}})");

  auto validation = ServerConfig::fromConfig(config()).validate();
  EXPECT_TRUE(validation.isValid);
  EXPECT_EQ(validation.warnings.size(), 1u);
}

TEST_F(ConfigManagerTest, SecuritySection) {
  load(R"({"security": {
    "max_body_bytes": 4096,
    "api_key": "0123456789abcdef",
    "rate_limit": {"requests_per_minute": 10, "window_seconds": 30,
                   "idle_ttl_seconds": 120, "max_tracked_clients": 50}
  }})");

  auto security = config().getSecurityConfig();
  EXPECT_EQ(security.maxBodyBytes, 4096u);
  EXPECT_EQ(security.apiKey, "0123456789abcdef");
  EXPECT_EQ(security.rateLimit.requestsPerWindow, 10);
  EXPECT_EQ(security.rateLimit.window, std::chrono::seconds(30));
  EXPECT_EQ(security.rateLimit.idleTtl, std::chrono::seconds(120));
  EXPECT_EQ(security.rateLimit.maxTrackedClients, 50u);
}

TEST_F(ConfigManagerTest, InvalidSecurityValues) {
  load(R"({"security": {"max_body_bytes": 0, "api_key": "short",
                        "rate_limit": {"requests_per_minute": 0}}})");

  auto validation = SecurityConfig::fromConfig(config()).validate();
  EXPECT_FALSE(validation.isValid);
  EXPECT_EQ(validation.errors.size(), 3u);

  auto security = config().getSecurityConfig();
  EXPECT_EQ(security.maxBodyBytes, limits::kMaxRequestBodyBytes);
  EXPECT_EQ(security.rateLimit.requestsPerWindow,
            limits::kDefaultRequestsPerMinute);

  EXPECT_FALSE(config().validateConfiguration().isValid);
}

TEST_F(ConfigManagerTest, HttpAddressOverride) {
  load(R"({"server": {"address": "0.0.0.0", "port": 8080}})");

  config().applyHttpAddress("127.0.0.1:9090");
  EXPECT_EQ(config().getString("server.address"), "127.0.0.1");
  EXPECT_EQ(config().getInt("server.port"), 9090);

  config().applyHttpAddress(":7070");
  EXPECT_EQ(config().getString("server.address"), "127.0.0.1");
  EXPECT_EQ(config().getInt("server.port"), 7070);
}

TEST_F(ConfigManagerTest, MalformedHttpAddressThrows) {
  load("{}");

  for (const char *bad : {"localhost", "host:", "host:http", "host:0",
                          "host:65536"}) {
    try {
      config().applyHttpAddress(bad);
      ADD_FAILURE() << "expected SystemException for " << bad;
    } catch (const SystemException &e) {
      EXPECT_EQ(e.getCode(), ErrorCode::CONFIGURATION_ERROR) << bad;
      EXPECT_EQ(e.getComponent(), "ConfigManager");
    }
  }
}

TEST_F(ConfigManagerTest, LoggingConfig) {
  load(R"({"logging": {"level": "debug", "format": "json",
                       "file_output": true, "log_file": "/tmp/lg.log",
                       "max_backup_files": 3,
                       "component_filter": ["HttpServer", "RateLimiter"]}})");

  auto logging = config().getLoggingConfig();
  EXPECT_EQ(logging.level, LogLevel::DEBUG);
  EXPECT_EQ(logging.format, LogFormat::JSON);
  EXPECT_TRUE(logging.fileOutput);
  EXPECT_EQ(logging.logFile, "/tmp/lg.log");
  EXPECT_EQ(logging.maxBackupFiles, 3);
  EXPECT_EQ(logging.componentFilter.size(), 2u);
  EXPECT_EQ(logging.componentFilter.count("RateLimiter"), 1u);
}

TEST_F(ConfigManagerTest, LoggingDefaults) {
  load("{}");

  auto logging = config().getLoggingConfig();
  EXPECT_EQ(logging.level, LogLevel::INFO);
  EXPECT_EQ(logging.format, LogFormat::TEXT);
  EXPECT_TRUE(logging.consoleOutput);
  EXPECT_FALSE(logging.fileOutput);
  EXPECT_EQ(logging.logFile, "logs/ledgerguard.log");
  EXPECT_TRUE(logging.componentFilter.empty());
}

TEST_F(ConfigManagerTest, CommaSeparatedStringSet) {
  load(R"({"logging": {"component_filter": "Router, HttpServer ,"}})");

  auto filter = config().getStringSet("logging.component_filter");
  EXPECT_EQ(filter.size(), 2u);
  EXPECT_EQ(filter.count("Router"), 1u);
  EXPECT_EQ(filter.count("HttpServer"), 1u);
}
