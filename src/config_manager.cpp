#include "config_manager.hpp"
#include "component_logger.hpp"
#include "sanitizer_exceptions.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace logguard {

namespace {
constexpr int kMaxFlattenDepth = 32;
}

void ConfigValidationResult::merge(const ConfigValidationResult &other,
                                   const std::string &prefix) {
  isValid = isValid && other.isValid;
  for (const auto &error : other.errors) {
    errors.push_back(prefix + error);
  }
  for (const auto &warning : other.warnings) {
    warnings.push_back(prefix + warning);
  }
}

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

  // Non-throwing parse; a discarded value signals a syntax error
  nlohmann::json jsonConfig = nlohmann::json::parse(file, nullptr, false);
  if (jsonConfig.is_discarded()) {
    CONFIG_LOG_ERROR("Failed to parse JSON config file: {}", configPath);
    return false;
  }

  return applyJson(jsonConfig);
}

bool ConfigManager::loadFromString(const std::string &jsonText) {
  nlohmann::json jsonConfig = nlohmann::json::parse(jsonText, nullptr, false);
  if (jsonConfig.is_discarded()) {
    CONFIG_LOG_ERROR("Failed to parse JSON configuration string");
    return false;
  }
  return applyJson(jsonConfig);
}

void ConfigManager::requireConfig(const std::string &configPath) {
  if (!loadConfig(configPath)) {
    throw createSystemError(ErrorCode::CONFIGURATION_ERROR, "ConfigManager",
                            "Unable to load configuration from " + configPath);
  }
}

void ConfigManager::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  configData_.clear();
  rawConfig_ = nlohmann::json::object();
}

bool ConfigManager::applyJson(const nlohmann::json &jsonConfig) {
  if (!jsonConfig.is_object()) {
    CONFIG_LOG_ERROR("Configuration root must be a JSON object");
    return false;
  }

  size_t parameterCount = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    configData_.clear();
    rawConfig_ = jsonConfig;
    flattenJson(jsonConfig, "", 0, kMaxFlattenDepth);
    parameterCount = configData_.size();
  }

  CONFIG_LOG_INFO("Configuration loaded successfully with {} parameters",
                  parameterCount);
  return true;
}

void ConfigManager::flattenJson(const nlohmann::json &json,
                                const std::string &prefix, int currentDepth,
                                int maxDepth) {
  if (currentDepth >= maxDepth) {
    configData_[prefix] = json.dump();
    return;
  }

  for (auto it = json.begin(); it != json.end(); ++it) {
    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

    if (it->is_object()) {
      flattenJson(*it, key, currentDepth + 1, maxDepth);
    } else if (it->is_string()) {
      configData_[key] = it->get<std::string>();
    } else if (it->is_number_integer()) {
      configData_[key] = std::to_string(it->get<long long>());
    } else if (it->is_boolean()) {
      configData_[key] = it->get<bool>() ? "true" : "false";
    } else {
      // Arrays and floats keep their JSON text
      configData_[key] = it->dump();
    }
  }
}

std::optional<std::string> ConfigManager::lookup(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
    return it->second;
  }
  return std::nullopt;
}

bool ConfigManager::hasKey(const std::string &key) const {
  return lookup(key).has_value();
}

std::string ConfigManager::getString(const std::string &key,
                                     const std::string &defaultValue) const {
  return lookup(key).value_or(defaultValue);
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  if (auto value = lookup(key)) {
    try {
      return std::stoi(*value);
    } catch (const std::invalid_argument &) {
      return defaultValue;
    } catch (const std::out_of_range &) {
      return defaultValue;
    }
  }
  return defaultValue;
}

int64_t ConfigManager::getInt64(const std::string &key,
                                int64_t defaultValue) const {
  if (auto value = lookup(key)) {
    try {
      return std::stoll(*value);
    } catch (const std::invalid_argument &) {
      return defaultValue;
    } catch (const std::out_of_range &) {
      return defaultValue;
    }
  }
  return defaultValue;
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  if (auto value = lookup(key)) {
    std::string lowered = *value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), ::tolower);
    return lowered == "true" || lowered == "1" || lowered == "yes" ||
           lowered == "on";
  }
  return defaultValue;
}

double ConfigManager::getDouble(const std::string &key,
                                double defaultValue) const {
  if (auto value = lookup(key)) {
    try {
      return std::stod(*value);
    } catch (const std::invalid_argument &) {
      return defaultValue;
    } catch (const std::out_of_range &) {
      return defaultValue;
    }
  }
  return defaultValue;
}

nlohmann::json ConfigManager::getJsonConfig() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rawConfig_;
}

LogConfig ConfigManager::getLoggingConfig() const {
  LogConfig config;

  config.level = parseLogLevel(getString("logging.level", "INFO"));
  config.format = parseLogFormat(getString("logging.format", "TEXT"));
  config.consoleOutput = getBool("logging.console_output", true);
  config.fileOutput = getBool("logging.file_output", false);
  config.logFile = getString("logging.log_file", "logs/logguard.log");
  config.maxFileSize =
      static_cast<size_t>(getInt64("logging.max_file_size", 10485760));
  config.maxBackupFiles = getInt("logging.max_backup_files", 5);
  config.enableRotation = getBool("logging.enable_rotation", true);

  std::string filter = getString("logging.component_filter");
  if (!filter.empty()) {
    auto parsed = nlohmann::json::parse(filter, nullptr, false);
    if (parsed.is_array()) {
      for (const auto &item : parsed) {
        if (item.is_string()) {
          config.componentFilter.insert(item.get<std::string>());
        }
      }
    }
  }

  return config;
}

SanitizerConfig ConfigManager::getSanitizerConfig() const {
  return SanitizerConfig::fromConfig(*this);
}

LedgerConfig ConfigManager::getLedgerConfig() const {
  return LedgerConfig::fromConfig(*this);
}

ConfigValidationResult ConfigManager::validateConfiguration() const {
  ConfigValidationResult result;
  result.merge(getSanitizerConfig().validate(), "Sanitizer: ");
  result.merge(getLedgerConfig().validate(), "Statistics: ");

  for (const auto &warning : result.warnings) {
    CONFIG_LOG_WARN(warning);
  }
  for (const auto &error : result.errors) {
    CONFIG_LOG_ERROR(error);
  }
  return result;
}

LogLevel ConfigManager::parseLogLevel(const std::string &levelStr) {
  std::string level = levelStr;
  std::transform(level.begin(), level.end(), level.begin(), ::toupper);

  if (level == "DEBUG")
    return LogLevel::DEBUG;
  if (level == "WARN" || level == "WARNING")
    return LogLevel::WARN;
  if (level == "ERROR")
    return LogLevel::ERROR;
  if (level == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO;
}

LogFormat ConfigManager::parseLogFormat(const std::string &formatStr) {
  std::string format = formatStr;
  std::transform(format.begin(), format.end(), format.begin(), ::toupper);
  return format == "JSON" ? LogFormat::JSON : LogFormat::TEXT;
}

// ===== SeverityWeights Implementation =====

double SeverityWeights::forSeverity(Severity severity) const {
  switch (severity) {
  case Severity::LOW:
    return low;
  case Severity::MEDIUM:
    return medium;
  case Severity::HIGH:
    return high;
  case Severity::CRITICAL:
    return critical;
  }
  return critical;
}

bool SeverityWeights::operator==(const SeverityWeights &other) const {
  return low == other.low && medium == other.medium && high == other.high &&
         critical == other.critical;
}

// ===== SanitizerConfig Implementation =====

SanitizerConfig SanitizerConfig::fromConfig(const ConfigManager &config) {
  SanitizerConfig sc;

  sc.maxLogSize = config.getInt64("sanitizer.max_log_size", sc.maxLogSize);
  sc.maxLineLength =
      config.getInt64("sanitizer.max_line_length", sc.maxLineLength);
  sc.maxJsonDepth = config.getInt("sanitizer.max_json_depth", sc.maxJsonDepth);
  sc.suspiciousPatternThreshold =
      config.getDouble("sanitizer.suspicious_pattern_threshold",
                       sc.suspiciousPatternThreshold);
  sc.suspiciousMatchWeight = config.getDouble(
      "sanitizer.suspicious_match_weight", sc.suspiciousMatchWeight);
  sc.binaryRatioThreshold = config.getDouble(
      "sanitizer.binary_ratio_threshold", sc.binaryRatioThreshold);
  sc.minCompressedLineLength = config.getInt(
      "sanitizer.min_compressed_line_length", sc.minCompressedLineLength);
  sc.entropyThreshold =
      config.getDouble("sanitizer.entropy_threshold", sc.entropyThreshold);
  sc.severityWeights.low = config.getDouble("sanitizer.severity_weights.low",
                                            sc.severityWeights.low);
  sc.severityWeights.medium = config.getDouble(
      "sanitizer.severity_weights.medium", sc.severityWeights.medium);
  sc.severityWeights.high = config.getDouble("sanitizer.severity_weights.high",
                                             sc.severityWeights.high);
  sc.severityWeights.critical = config.getDouble(
      "sanitizer.severity_weights.critical", sc.severityWeights.critical);
  sc.sizePenalty = config.getDouble("sanitizer.size_penalty", sc.sizePenalty);
  sc.sizeChangePenaltyRatio = config.getDouble(
      "sanitizer.size_change_penalty_ratio", sc.sizeChangePenaltyRatio);
  sc.enableFileTypeSniffing = config.getBool(
      "sanitizer.enable_file_type_sniffing", sc.enableFileTypeSniffing);
  sc.rescreenDecompressed = config.getBool("sanitizer.rescreen_decompressed",
                                           sc.rescreenDecompressed);

  return sc;
}

ConfigValidationResult SanitizerConfig::validate() const {
  ConfigValidationResult result;

  if (maxLogSize <= 0) {
    std::stringstream ss;
    ss << "max_log_size must be positive, got: " << maxLogSize;
    result.addError(ss.str());
  }

  if (maxLineLength <= 0) {
    std::stringstream ss;
    ss << "max_line_length must be positive, got: " << maxLineLength;
    result.addError(ss.str());
  } else if (maxLogSize > 0 && maxLineLength > maxLogSize) {
    std::stringstream ss;
    ss << "max_line_length (" << maxLineLength
       << ") exceeds max_log_size (" << maxLogSize
       << "), the line limit will never apply";
    result.addWarning(ss.str());
  }

  if (maxJsonDepth <= 0) {
    std::stringstream ss;
    ss << "max_json_depth must be positive, got: " << maxJsonDepth;
    result.addError(ss.str());
  } else if (maxJsonDepth > 1000) {
    std::stringstream ss;
    ss << "max_json_depth is very high (" << maxJsonDepth
       << "), deeply nested payloads will be kept as-is";
    result.addWarning(ss.str());
  }

  if (suspiciousPatternThreshold < 0.0) {
    std::stringstream ss;
    ss << "suspicious_pattern_threshold must not be negative, got: "
       << suspiciousPatternThreshold;
    result.addError(ss.str());
  }

  if (suspiciousMatchWeight <= 0.0) {
    std::stringstream ss;
    ss << "suspicious_match_weight must be positive, got: "
       << suspiciousMatchWeight;
    result.addError(ss.str());
  }

  if (binaryRatioThreshold <= 0.0 || binaryRatioThreshold > 1.0) {
    std::stringstream ss;
    ss << "binary_ratio_threshold must be in (0, 1], got: "
       << binaryRatioThreshold;
    result.addError(ss.str());
  }

  if (minCompressedLineLength < 0) {
    std::stringstream ss;
    ss << "min_compressed_line_length must not be negative, got: "
       << minCompressedLineLength;
    result.addError(ss.str());
  }

  if (entropyThreshold <= 0.0 || entropyThreshold > 8.0) {
    std::stringstream ss;
    ss << "entropy_threshold must be in (0, 8] bits per byte, got: "
       << entropyThreshold;
    result.addError(ss.str());
  }

  if (severityWeights.low < 0.0 || severityWeights.medium < 0.0 ||
      severityWeights.high < 0.0 || severityWeights.critical < 0.0) {
    result.addError("severity weights must not be negative");
  } else if (!(severityWeights.low <= severityWeights.medium &&
               severityWeights.medium <= severityWeights.high &&
               severityWeights.high <= severityWeights.critical)) {
    result.addWarning(
        "severity weights are not ordered low <= medium <= high <= critical");
  }

  if (sizePenalty < 0.0 || sizePenalty > 1.0) {
    std::stringstream ss;
    ss << "size_penalty must be in [0, 1], got: " << sizePenalty;
    result.addError(ss.str());
  }

  if (sizeChangePenaltyRatio < 0.0) {
    std::stringstream ss;
    ss << "size_change_penalty_ratio must not be negative, got: "
       << sizeChangePenaltyRatio;
    result.addError(ss.str());
  }

  return result;
}

bool SanitizerConfig::operator==(const SanitizerConfig &other) const {
  return maxLogSize == other.maxLogSize &&
         maxLineLength == other.maxLineLength &&
         maxJsonDepth == other.maxJsonDepth &&
         suspiciousPatternThreshold == other.suspiciousPatternThreshold &&
         suspiciousMatchWeight == other.suspiciousMatchWeight &&
         binaryRatioThreshold == other.binaryRatioThreshold &&
         minCompressedLineLength == other.minCompressedLineLength &&
         entropyThreshold == other.entropyThreshold &&
         severityWeights == other.severityWeights &&
         sizePenalty == other.sizePenalty &&
         sizeChangePenaltyRatio == other.sizeChangePenaltyRatio &&
         enableFileTypeSniffing == other.enableFileTypeSniffing &&
         rescreenDecompressed == other.rescreenDecompressed;
}

// ===== LedgerConfig Implementation =====

LedgerConfig LedgerConfig::fromConfig(const ConfigManager &config) {
  LedgerConfig lc;
  int64_t capacity = config.getInt64("statistics.history_capacity",
                                     static_cast<int64_t>(lc.historyCapacity));
  int64_t window = config.getInt64("statistics.window",
                                   static_cast<int64_t>(lc.statisticsWindow));
  // Negative values collapse to zero and are reported by validate()
  lc.historyCapacity = static_cast<size_t>(std::max<int64_t>(capacity, 0));
  lc.statisticsWindow = static_cast<size_t>(std::max<int64_t>(window, 0));
  return lc;
}

ConfigValidationResult LedgerConfig::validate() const {
  ConfigValidationResult result;

  if (historyCapacity == 0) {
    result.addError("history_capacity must be positive");
  }
  if (statisticsWindow == 0) {
    result.addError("window must be positive");
  } else if (statisticsWindow > historyCapacity) {
    std::stringstream ss;
    ss << "window (" << statisticsWindow << ") exceeds history_capacity ("
       << historyCapacity << "), averages cover the whole history";
    result.addWarning(ss.str());
  }

  return result;
}

} // namespace logguard
