#include "ledgerguard/logger.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ledgerguard {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    shutdown();
}

void Logger::configure(const LogConfig& config) {
    bool wantAsync = false;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_ = config;
        wantAsync = config_.asyncLogging;

        if (config_.fileOutput) {
            openLogFile(config_.logFile);
        }
    }

    if (wantAsync && !asyncStarted_) {
        startAsyncWorker();
    } else if (!wantAsync && asyncStarted_) {
        stopAsyncWorker();
    }
}

void Logger::openLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> fileLock(fileMutex_);

    if (fileStream_.is_open()) {
        fileStream_.close();
    }

    std::error_code ec;
    std::filesystem::path logPath(filename);
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
    }

    fileStream_.open(filename, std::ios::app);
    if (!fileStream_.is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        config_.fileOutput = false;
        return;
    }

    currentFileSize_ = std::filesystem::exists(filename, ec)
                           ? std::filesystem::file_size(filename, ec)
                           : 0;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.level = level;
}

void Logger::setLogFormat(LogFormat format) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.format = format;
}

void Logger::enableConsoleOutput(bool enable) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.consoleOutput = enable;
}

void Logger::setComponentFilter(const StringSet& components) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.componentFilter = components;
}

LogConfig Logger::getConfig() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const LogContext& context) {
    if (!shouldLog(level, component)) {
        return;
    }

    metrics_.totalMessages++;
    if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
        metrics_.errorCount++;
    } else if (level == LogLevel::WARN) {
        metrics_.warningCount++;
    }

    writeLog(formatMessage(level, component, message, context));
}

void Logger::debug(const std::string& component, const std::string& message,
                   const LogContext& context) {
    log(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string& component, const std::string& message,
                  const LogContext& context) {
    log(LogLevel::INFO, component, message, context);
}

void Logger::warn(const std::string& component, const std::string& message,
                  const LogContext& context) {
    log(LogLevel::WARN, component, message, context);
}

void Logger::error(const std::string& component, const std::string& message,
                   const LogContext& context) {
    log(LogLevel::ERROR, component, message, context);
}

void Logger::fatal(const std::string& component, const std::string& message,
                   const LogContext& context) {
    log(LogLevel::FATAL, component, message, context);
}

LogMetrics Logger::getMetrics() const {
    return metrics_;
}

void Logger::flush() {
    if (asyncStarted_) {
        std::lock_guard<std::mutex> lock(asyncMutex_);
        asyncCondition_.notify_all();
    }

    std::lock_guard<std::mutex> lock(fileMutex_);
    if (fileStream_.is_open()) {
        fileStream_.flush();
    }
}

void Logger::shutdown() {
    if (asyncStarted_) {
        stopAsyncWorker();
    }

    std::lock_guard<std::mutex> lock(fileMutex_);
    if (fileStream_.is_open()) {
        fileStream_.close();
    }
}

std::string Logger::formatTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time_t, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

std::string Logger::formatMessage(LogLevel level, const std::string& component,
                                  const std::string& message,
                                  const LogContext& context) const {
    LogFormat format;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        format = config_.format;
    }
    return format == LogFormat::JSON
        ? formatJsonMessage(level, component, message, context)
        : formatTextMessage(level, component, message, context);
}

std::string Logger::formatTextMessage(LogLevel level, const std::string& component,
                                      const std::string& message,
                                      const LogContext& context) const {
    std::ostringstream oss;
    oss << "[" << formatTimestamp() << "] "
        << "[" << levelToString(level) << "] "
        << "[" << component << "] "
        << message;

    if (!context.empty()) {
        oss << " |";
        for (const auto& [key, value] : context) {
            oss << " " << key << "=" << value;
        }
    }

    return oss.str();
}

std::string Logger::formatJsonMessage(LogLevel level, const std::string& component,
                                      const std::string& message,
                                      const LogContext& context) const {
    std::string levelName = levelToString(level);
    while (!levelName.empty() && levelName.back() == ' ') {
        levelName.pop_back();
    }

    std::ostringstream oss;
    oss << "{"
        << "\"timestamp\":\"" << formatTimestamp() << "\","
        << "\"level\":\"" << levelName << "\","
        << "\"component\":\"" << escapeJson(component) << "\","
        << "\"message\":\"" << escapeJson(message) << "\"";

    if (!context.empty()) {
        oss << ",\"context\":{";
        bool first = true;
        for (const auto& [key, value] : context) {
            if (!first) oss << ",";
            oss << "\"" << escapeJson(key) << "\":\"" << escapeJson(value) << "\"";
            first = false;
        }
        oss << "}";
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escapeJson(const std::string& str) {
    std::string result;
    result.reserve(str.length() + 20);

    for (char c : str) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::setfill('0') << std::setw(4) << std::hex
                        << static_cast<int>(static_cast<unsigned char>(c));
                    result += oss.str();
                } else {
                    result += c;
                }
                break;
        }
    }

    return result;
}

bool Logger::shouldLog(LogLevel level, const std::string& component) const {
    std::lock_guard<std::mutex> lock(configMutex_);
    if (level < config_.level) {
        return false;
    }
    if (!config_.componentFilter.empty() &&
        config_.componentFilter.find(component) == config_.componentFilter.end()) {
        return false;
    }
    return true;
}

void Logger::writeLog(const std::string& formattedMessage) {
    if (asyncStarted_) {
        writeLogAsync(formattedMessage);
    } else {
        writeLogSync(formattedMessage);
    }
}

void Logger::writeLogSync(const std::string& formattedMessage) {
    bool console;
    bool file;
    bool rotate;
    size_t maxFileSize;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        console = config_.consoleOutput;
        file = config_.fileOutput;
        rotate = config_.enableRotation;
        maxFileSize = config_.maxFileSize;
    }

    if (console) {
        std::cout << formattedMessage << std::endl;
    }

    if (file) {
        std::lock_guard<std::mutex> lock(fileMutex_);
        if (fileStream_.is_open()) {
            if (rotate && currentFileSize_ + formattedMessage.length() > maxFileSize) {
                rotateLogFile();
            }

            fileStream_ << formattedMessage << '\n';
            fileStream_.flush();
            currentFileSize_ += formattedMessage.length() + 1;
        }
    }
}

void Logger::writeLogAsync(const std::string& formattedMessage) {
    size_t maxQueue;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        maxQueue = config_.maxQueueSize;
    }

    std::lock_guard<std::mutex> lock(asyncMutex_);
    if (messageQueue_.size() >= maxQueue) {
        metrics_.droppedMessages++;
        return;
    }

    messageQueue_.push(formattedMessage);
    asyncCondition_.notify_one();
}

void Logger::startAsyncWorker() {
    stopAsync_ = false;
    asyncStarted_ = true;
    asyncThread_ = std::thread(&Logger::asyncWorker, this);
}

void Logger::stopAsyncWorker() {
    {
        std::lock_guard<std::mutex> lock(asyncMutex_);
        stopAsync_ = true;
    }
    asyncCondition_.notify_all();
    if (asyncThread_.joinable()) {
        asyncThread_.join();
    }
    asyncStarted_ = false;
}

void Logger::asyncWorker() {
    std::unique_lock<std::mutex> lock(asyncMutex_);
    while (true) {
        asyncCondition_.wait(lock, [this] {
            return !messageQueue_.empty() || stopAsync_;
        });

        while (!messageQueue_.empty()) {
            std::string message = std::move(messageQueue_.front());
            messageQueue_.pop();
            lock.unlock();
            writeLogSync(message);
            lock.lock();
        }

        if (stopAsync_) {
            break;
        }
    }
}

// Caller holds fileMutex_
void Logger::rotateLogFile() {
    std::string logFile;
    int maxBackupFiles;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        logFile = config_.logFile;
        maxBackupFiles = config_.maxBackupFiles;
    }

    fileStream_.close();

    std::error_code ec;
    for (int i = maxBackupFiles - 1; i > 0; i--) {
        std::string oldFile = logFile + "." + std::to_string(i);
        std::string newFile = logFile + "." + std::to_string(i + 1);

        if (std::filesystem::exists(oldFile, ec)) {
            if (i == maxBackupFiles - 1) {
                std::filesystem::remove(newFile, ec);
            }
            std::filesystem::rename(oldFile, newFile, ec);
        }
    }

    if (std::filesystem::exists(logFile, ec)) {
        std::filesystem::rename(logFile, logFile + ".1", ec);
    }

    fileStream_.open(logFile, std::ios::out);
    currentFileSize_ = 0;
}

} // namespace ledgerguard
