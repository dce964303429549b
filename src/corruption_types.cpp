#include "corruption_types.hpp"
#include "sanitizer_exceptions.hpp"
#include <algorithm>

namespace logguard {

std::string toString(CorruptionType type) {
  switch (type) {
  case CorruptionType::BINARY_DATA:
    return "binary_data";
  case CorruptionType::MALFORMED_JSON:
    return "malformed_json";
  case CorruptionType::ENCODING_ERROR:
    return "encoding_error";
  case CorruptionType::INJECTION_ATTEMPT:
    return "injection_attempt";
  case CorruptionType::TRUNCATED_LOG:
    return "truncated_log";
  case CorruptionType::COMPRESSED_DATA:
    return "compressed_data";
  case CorruptionType::OVERSIZED_ENTRY:
    return "oversized_entry";
  case CorruptionType::SUSPICIOUS_PATTERN:
    return "suspicious_pattern";
  case CorruptionType::CONTROL_CHARACTERS:
    return "control_characters";
  case CorruptionType::NULL_BYTES:
    return "null_bytes";
  }
  return "unknown";
}

std::string toString(Severity severity) {
  switch (severity) {
  case Severity::LOW:
    return "low";
  case Severity::MEDIUM:
    return "medium";
  case Severity::HIGH:
    return "high";
  case Severity::CRITICAL:
    return "critical";
  }
  return "unknown";
}

std::string toString(SanitizationAction action) {
  switch (action) {
  case SanitizationAction::REMOVED:
    return "removed";
  case SanitizationAction::SANITIZED:
    return "sanitized";
  case SanitizationAction::QUARANTINED:
    return "quarantined";
  case SanitizationAction::TRUNCATED:
    return "truncated";
  case SanitizationAction::DECODED:
    return "decoded";
  case SanitizationAction::DECOMPRESSED:
    return "decompressed";
  case SanitizationAction::ESCAPED:
    return "escaped";
  }
  return "unknown";
}

CorruptionType corruptionTypeFromString(std::string_view name) {
  for (auto type : kAllCorruptionTypes) {
    if (toString(type) == name) {
      return type;
    }
  }
  throw ValidationException(ErrorCode::INVALID_FORMAT,
                            "Unknown corruption type: " + std::string(name),
                            "corruption_type", std::string(name));
}

Severity severityFromString(std::string_view name) {
  for (auto severity : {Severity::LOW, Severity::MEDIUM, Severity::HIGH,
                        Severity::CRITICAL}) {
    if (toString(severity) == name) {
      return severity;
    }
  }
  throw ValidationException(ErrorCode::INVALID_FORMAT,
                            "Unknown severity: " + std::string(name),
                            "severity", std::string(name));
}

nlohmann::json CorruptionDetection::toJson() const {
  return {{"type", toString(type)},
          {"severity", toString(severity)},
          {"location", location},
          {"description", description},
          {"sample", sample},
          {"confidence", confidence}};
}

bool SanitizationResult::hasCorruption(CorruptionType type) const {
  return countCorruption(type) > 0;
}

size_t SanitizationResult::countCorruption(CorruptionType type) const {
  return static_cast<size_t>(
      std::count_if(corruptionsDetected.begin(), corruptionsDetected.end(),
                    [type](const CorruptionDetection &d) {
                      return d.type == type;
                    }));
}

bool SanitizationResult::hasAction(SanitizationAction action) const {
  return std::any_of(actionsTaken.begin(), actionsTaken.end(),
                     [action](const ActionRecord &record) {
                       return record.first == action;
                     });
}

nlohmann::json SanitizationResult::toJson() const {
  nlohmann::json detections = nlohmann::json::array();
  for (const auto &detection : corruptionsDetected) {
    detections.push_back(detection.toJson());
  }

  nlohmann::json actions = nlohmann::json::array();
  for (const auto &[action, description] : actionsTaken) {
    actions.push_back({{"action", toString(action)},
                       {"description", description}});
  }

  return {{"original_size", originalSize},
          {"sanitized_size", sanitizedSize},
          {"corruptions_detected", std::move(detections)},
          {"actions_taken", std::move(actions)},
          {"sanitized_content", sanitizedContent},
          {"quarantined_content", quarantinedContent},
          {"processing_time_ms", processingTimeMs},
          {"safety_score", safetyScore}};
}

std::string truncateUtf8(std::string_view text, size_t maxBytes) {
  if (text.size() <= maxBytes) {
    return std::string(text);
  }
  size_t cut = maxBytes;
  // Back off continuation bytes so the cut lands on a sequence start
  while (cut > 0 &&
         (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return std::string(text.substr(0, cut));
}

std::string makeSample(std::string_view text) {
  return truncateUtf8(text, kMaxSampleLength);
}

CorruptionDetection makeDetection(CorruptionType type, Severity severity,
                                  std::string location,
                                  std::string description,
                                  std::string_view sample, double confidence) {
  return CorruptionDetection{type,
                             severity,
                             std::move(location),
                             std::move(description),
                             makeSample(sample),
                             std::clamp(confidence, 0.0, 1.0)};
}

} // namespace logguard
