#pragma once

#include "corruption_types.hpp"
#include "logger.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace logguard {

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

  void merge(const ConfigValidationResult &other, const std::string &prefix);
};

// Penalty applied per detection, scaled by the detection's confidence
struct SeverityWeights {
  double low = 0.05;
  double medium = 0.15;
  double high = 0.3;
  double critical = 0.5;

  double forSeverity(Severity severity) const;
  bool operator==(const SeverityWeights &other) const;
};

struct SanitizerConfig {
  int64_t maxLogSize = 100LL * 1024 * 1024; // 100MB
  int64_t maxLineLength = 64 * 1024;        // 64KB
  int maxJsonDepth = 20;
  double suspiciousPatternThreshold = 0.7;
  double suspiciousMatchWeight = 0.1;
  double binaryRatioThreshold = 0.1;
  int minCompressedLineLength = 100;
  double entropyThreshold = 7.5; // bits per byte
  SeverityWeights severityWeights;
  double sizePenalty = 0.2;
  double sizeChangePenaltyRatio = 0.5;
  bool enableFileTypeSniffing = true;
  bool rescreenDecompressed = true;

  static SanitizerConfig fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
  bool operator==(const SanitizerConfig &other) const;
};

struct LedgerConfig {
  size_t historyCapacity = 1000;
  size_t statisticsWindow = 100;

  static LedgerConfig fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
};

class ConfigManager {
public:
  static ConfigManager &getInstance();

  bool loadConfig(const std::string &configPath);
  bool loadFromString(const std::string &jsonText);
  // Like loadConfig, but throws SystemException when the file is unusable
  void requireConfig(const std::string &configPath);
  void clear();

  std::string getString(const std::string &key,
                        const std::string &defaultValue = "") const;
  int getInt(const std::string &key, int defaultValue = 0) const;
  int64_t getInt64(const std::string &key, int64_t defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  double getDouble(const std::string &key, double defaultValue = 0.0) const;
  bool hasKey(const std::string &key) const;

  LogConfig getLoggingConfig() const;
  SanitizerConfig getSanitizerConfig() const;
  LedgerConfig getLedgerConfig() const;

  ConfigValidationResult validateConfiguration() const;

  nlohmann::json getJsonConfig() const;

private:
  ConfigManager() = default;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string, TransparentStringHash,
                     std::equal_to<>>
      configData_;
  nlohmann::json rawConfig_;

  bool applyJson(const nlohmann::json &jsonConfig);
  void flattenJson(const nlohmann::json &json, const std::string &prefix,
                   int currentDepth, int maxDepth);
  std::optional<std::string> lookup(const std::string &key) const;
  static LogLevel parseLogLevel(const std::string &levelStr);
  static LogFormat parseLogFormat(const std::string &formatStr);
};

} // namespace logguard
