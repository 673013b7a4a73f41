#pragma once

#include "ledgerguard/logger.hpp"
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace ledgerguard::testing {

/**
 * Points the process logger at a file in a fresh temporary directory and
 * restores the previous configuration on destruction.
 */
class LogCapture {
public:
  explicit LogCapture(LogConfig config = {})
      : previous_(Logger::getInstance().getConfig()) {
    std::random_device rd;
    directory_ = std::filesystem::temp_directory_path() /
                 ("ledgerguard_log_" + std::to_string(rd()) + "_" +
                  std::to_string(rd()));
    std::filesystem::create_directories(directory_);

    config.consoleOutput = false;
    config.fileOutput = true;
    config.logFile = (directory_ / "test.log").string();
    Logger::getInstance().configure(config);
  }

  ~LogCapture() {
    Logger::getInstance().shutdown();
    Logger::getInstance().configure(previous_);
    std::error_code ec;
    std::filesystem::remove_all(directory_, ec);
  }

  LogCapture(const LogCapture &) = delete;
  LogCapture &operator=(const LogCapture &) = delete;

  std::string logFile() const { return (directory_ / "test.log").string(); }

  std::vector<std::string> lines(const std::string &path) const {
    Logger::getInstance().flush();
    std::vector<std::string> result;
    std::ifstream in(path);
    for (std::string line; std::getline(in, line);) {
      result.push_back(line);
    }
    return result;
  }

  std::vector<std::string> lines() const { return lines(logFile()); }

private:
  LogConfig previous_;
  std::filesystem::path directory_;
};

} // namespace ledgerguard::testing
