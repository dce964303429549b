#include "logger.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace logguard {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    shutdown();
}

void Logger::configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_ = config;

    std::lock_guard<std::mutex> fileLock(fileMutex_);
    if (fileStream_.is_open()) {
        fileStream_.close();
    }
    currentLogFile_ = config.logFile;

    if (config_.fileOutput && !openLogFileLocked(config.logFile)) {
        config_.fileOutput = false;
    }
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const LogContext& context) {
    LogConfig config = snapshotConfig();
    if (!shouldLog(config, level, component)) {
        return;
    }

    metrics_.totalMessages++;
    if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
        metrics_.errorCount++;
    } else if (level == LogLevel::WARN) {
        metrics_.warningCount++;
    }

    writeLog(config, formatMessage(config, level, component, message, context));
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

void Logger::logPerformance(const std::string& operation, double durationMs,
                            const LogContext& context) {
    auto perfContext = context;
    perfContext["operation"] = operation;
    perfContext["duration_ms"] = std::to_string(durationMs);

    log(LogLevel::DEBUG, "Performance", "Operation completed: " + operation, perfContext);
}

LogMetrics Logger::getMetrics() const {
    return metrics_;
}

void Logger::flush() {
    std::cout.flush();
    std::lock_guard<std::mutex> lock(fileMutex_);
    if (fileStream_.is_open()) {
        fileStream_.flush();
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(fileMutex_);
    if (fileStream_.is_open()) {
        fileStream_.close();
    }
}

std::string Logger::formatTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
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

std::string Logger::formatMessage(const LogConfig& config, LogLevel level,
                                  const std::string& component,
                                  const std::string& message,
                                  const LogContext& context) const {
    return config.format == LogFormat::JSON
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
    levelName.erase(levelName.find_last_not_of(' ') + 1);

    nlohmann::json entry = {
        {"timestamp", formatTimestamp()},
        {"level", levelName},
        {"component", component},
        {"message", message}
    };

    if (!context.empty()) {
        nlohmann::json ctx = nlohmann::json::object();
        for (const auto& [key, value] : context) {
            ctx[key] = value;
        }
        entry["context"] = std::move(ctx);
    }

    // Messages may carry fragments of hostile input, never let them throw
    return entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Logger::writeLog(const LogConfig& config, const std::string& formattedMessage) {
    if (config.consoleOutput) {
        std::cout << formattedMessage << '\n';
    }

    if (!config.fileOutput) {
        return;
    }

    std::lock_guard<std::mutex> lock(fileMutex_);
    if (!fileStream_.is_open()) {
        return;
    }

    if (config.enableRotation &&
        currentFileSize_ + formattedMessage.length() > config.maxFileSize) {
        rotateLogFileLocked(config);
        if (!fileStream_.is_open()) {
            return;
        }
    }

    fileStream_ << formattedMessage << '\n';
    fileStream_.flush();
    currentFileSize_ += formattedMessage.length() + 1;
}

bool Logger::openLogFileLocked(const std::string& filename) {
    std::filesystem::path logPath(filename);
    std::error_code ec;
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
    }

    fileStream_.open(filename, std::ios::app);
    if (!fileStream_.is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        return false;
    }

    currentFileSize_ = std::filesystem::exists(filename, ec)
        ? static_cast<size_t>(std::filesystem::file_size(filename, ec))
        : 0;
    if (ec) {
        currentFileSize_ = 0;
    }
    return true;
}

void Logger::rotateLogFileLocked(const LogConfig& config) {
    fileStream_.close();

    std::error_code ec;
    for (int i = config.maxBackupFiles - 1; i > 0; i--) {
        std::string oldFile = currentLogFile_ + "." + std::to_string(i);
        std::string newFile = currentLogFile_ + "." + std::to_string(i + 1);

        if (std::filesystem::exists(oldFile, ec)) {
            if (i == config.maxBackupFiles - 1) {
                std::filesystem::remove(newFile, ec);
            }
            std::filesystem::rename(oldFile, newFile, ec);
        }
    }

    if (config.maxBackupFiles > 0 && std::filesystem::exists(currentLogFile_, ec)) {
        std::filesystem::rename(currentLogFile_, currentLogFile_ + ".1", ec);
    }

    fileStream_.open(currentLogFile_, std::ios::out | std::ios::trunc);
    currentFileSize_ = 0;

    if (!fileStream_.is_open()) {
        std::cerr << "Failed to create new log file after rotation: " << currentLogFile_ << std::endl;
    }
}

bool Logger::shouldLog(const LogConfig& config, LogLevel level,
                       const std::string& component) const {
    if (level < config.level) {
        return false;
    }

    if (!config.componentFilter.empty() &&
        config.componentFilter.find(component) == config.componentFilter.end()) {
        return false;
    }

    return true;
}

LogConfig Logger::snapshotConfig() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

} // namespace logguard
