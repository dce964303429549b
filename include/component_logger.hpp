#pragma once

#include "logger.hpp"
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace logguard {

template <typename Component> struct ComponentTrait;

template <> struct ComponentTrait<class ConfigManager> {
  static constexpr const char *name = "ConfigManager";
};

template <> struct ComponentTrait<class LogSanitizer> {
  static constexpr const char *name = "LogSanitizer";
};

template <> struct ComponentTrait<class EncodingNormalizer> {
  static constexpr const char *name = "EncodingNormalizer";
};

template <> struct ComponentTrait<class ContentFilters> {
  static constexpr const char *name = "ContentFilters";
};

template <> struct ComponentTrait<class PatternRuleSet> {
  static constexpr const char *name = "PatternRuleSet";
};

template <> struct ComponentTrait<class JsonRepair> {
  static constexpr const char *name = "JsonRepair";
};

template <> struct ComponentTrait<class CompressionDetector> {
  static constexpr const char *name = "CompressionDetector";
};

template <> struct ComponentTrait<class CorruptionLedger> {
  static constexpr const char *name = "CorruptionLedger";
};

template <> struct ComponentTrait<class QuarantineStore> {
  static constexpr const char *name = "QuarantineStore";
};

template <> struct ComponentTrait<class SanitizerSelfTest> {
  static constexpr const char *name = "SanitizerSelfTest";
};

/**
 * ComponentLogger - compile-time component name resolution on top of the
 * Logger singleton. Messages accept "{}" placeholders that are filled in
 * order from the trailing arguments.
 */
template <typename Component> class ComponentLogger {
private:
  static_assert(std::is_class_v<Component>, "Component must be a class type");

  static constexpr const char *component_name = ComponentTrait<Component>::name;

  static Logger &getLogger() { return Logger::getInstance(); }

public:
  template <typename... Args>
  static void debug(const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      getLogger().debug(component_name,
                        format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().debug(component_name, message);
    }
  }

  template <typename... Args>
  static void info(const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      getLogger().info(component_name,
                       format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().info(component_name, message);
    }
  }

  template <typename... Args>
  static void warn(const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      getLogger().warn(component_name,
                       format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().warn(component_name, message);
    }
  }

  template <typename... Args>
  static void error(const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      getLogger().error(component_name,
                        format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().error(component_name, message);
    }
  }

  static void debugWithContext(const std::string &message,
                               const LogContext &context = {}) {
    getLogger().debug(component_name, message, context);
  }

  static void infoWithContext(const std::string &message,
                              const LogContext &context = {}) {
    getLogger().info(component_name, message, context);
  }

  static void warnWithContext(const std::string &message,
                              const LogContext &context = {}) {
    getLogger().warn(component_name, message, context);
  }

  static void logPerformance(const std::string &operation, double durationMs,
                             const LogContext &context = {}) {
    getLogger().logPerformance(operation, durationMs, context);
  }

  static constexpr const char *getComponentName() { return component_name; }

  // Public for tests
  template <typename... Args>
  static std::string format_message(const std::string &format, Args &&...args) {
    std::stringstream ss;
    format_impl(ss, format, std::forward<Args>(args)...);
    return ss.str();
  }

private:
  template <typename T>
  static void stream_value(std::stringstream &ss, T &&value) {
    if constexpr (std::is_arithmetic_v<std::decay_t<T>> ||
                  std::is_convertible_v<T, std::string>) {
      ss << std::forward<T>(value);
    } else {
      ss << "[object]";
    }
  }

  template <typename T, typename... Args>
  static void format_impl(std::stringstream &ss, const std::string &format,
                          T &&arg, Args &&...args) {
    size_t pos = format.find("{}");
    if (pos != std::string::npos) {
      ss << format.substr(0, pos);
      stream_value(ss, std::forward<T>(arg));
      if constexpr (sizeof...(args) > 0) {
        format_impl(ss, format.substr(pos + 2), std::forward<Args>(args)...);
      } else {
        ss << format.substr(pos + 2);
      }
    } else {
      ss << format;
    }
  }

  static void format_impl(std::stringstream &ss, const std::string &format) {
    ss << format;
  }
};

using ConfigLogger = ComponentLogger<class ConfigManager>;
using SanitizerLogger = ComponentLogger<class LogSanitizer>;
using EncodingLogger = ComponentLogger<class EncodingNormalizer>;
using FilterLogger = ComponentLogger<class ContentFilters>;
using PatternLogger = ComponentLogger<class PatternRuleSet>;
using JsonRepairLogger = ComponentLogger<class JsonRepair>;
using CompressionLogger = ComponentLogger<class CompressionDetector>;
using LedgerLogger = ComponentLogger<class CorruptionLedger>;
using QuarantineLogger = ComponentLogger<class QuarantineStore>;
using SelfTestLogger = ComponentLogger<class SanitizerSelfTest>;

} // namespace logguard

#define CONFIG_LOG_DEBUG(message, ...)                                         \
  logguard::ConfigLogger::debug(message, ##__VA_ARGS__)
#define CONFIG_LOG_INFO(message, ...)                                          \
  logguard::ConfigLogger::info(message, ##__VA_ARGS__)
#define CONFIG_LOG_WARN(message, ...)                                          \
  logguard::ConfigLogger::warn(message, ##__VA_ARGS__)
#define CONFIG_LOG_ERROR(message, ...)                                         \
  logguard::ConfigLogger::error(message, ##__VA_ARGS__)

#define SANITIZER_LOG_DEBUG(message, ...)                                      \
  logguard::SanitizerLogger::debug(message, ##__VA_ARGS__)
#define SANITIZER_LOG_INFO(message, ...)                                       \
  logguard::SanitizerLogger::info(message, ##__VA_ARGS__)
#define SANITIZER_LOG_WARN(message, ...)                                       \
  logguard::SanitizerLogger::warn(message, ##__VA_ARGS__)
#define SANITIZER_LOG_ERROR(message, ...)                                      \
  logguard::SanitizerLogger::error(message, ##__VA_ARGS__)

#define LEDGER_LOG_DEBUG(message, ...)                                         \
  logguard::LedgerLogger::debug(message, ##__VA_ARGS__)
#define LEDGER_LOG_INFO(message, ...)                                          \
  logguard::LedgerLogger::info(message, ##__VA_ARGS__)
#define LEDGER_LOG_WARN(message, ...)                                          \
  logguard::LedgerLogger::warn(message, ##__VA_ARGS__)
