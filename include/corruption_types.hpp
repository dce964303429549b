#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace logguard {

enum class CorruptionType {
  BINARY_DATA,
  MALFORMED_JSON,
  ENCODING_ERROR,
  INJECTION_ATTEMPT,
  TRUNCATED_LOG,
  COMPRESSED_DATA,
  OVERSIZED_ENTRY,
  SUSPICIOUS_PATTERN,
  CONTROL_CHARACTERS,
  NULL_BYTES
};

inline constexpr CorruptionType kAllCorruptionTypes[] = {
    CorruptionType::BINARY_DATA,        CorruptionType::MALFORMED_JSON,
    CorruptionType::ENCODING_ERROR,     CorruptionType::INJECTION_ATTEMPT,
    CorruptionType::TRUNCATED_LOG,      CorruptionType::COMPRESSED_DATA,
    CorruptionType::OVERSIZED_ENTRY,    CorruptionType::SUSPICIOUS_PATTERN,
    CorruptionType::CONTROL_CHARACTERS, CorruptionType::NULL_BYTES};

// Ordered: comparisons follow escalation
enum class Severity { LOW = 0, MEDIUM = 1, HIGH = 2, CRITICAL = 3 };

enum class SanitizationAction {
  REMOVED,
  SANITIZED,
  QUARANTINED,
  TRUNCATED,
  DECODED,
  DECOMPRESSED,
  ESCAPED
};

std::string toString(CorruptionType type);
std::string toString(Severity severity);
std::string toString(SanitizationAction action);

// Throw ValidationException for names outside the closed sets
CorruptionType corruptionTypeFromString(std::string_view name);
Severity severityFromString(std::string_view name);

struct CorruptionDetection {
  CorruptionType type;
  Severity severity;
  std::string location;
  std::string description;
  std::string sample;
  double confidence = 0.0;

  nlohmann::json toJson() const;
};

// Audit trail entry: what was done and a free-text explanation
using ActionRecord = std::pair<SanitizationAction, std::string>;

struct SanitizationResult {
  size_t originalSize = 0;
  size_t sanitizedSize = 0;
  std::vector<CorruptionDetection> corruptionsDetected;
  std::vector<ActionRecord> actionsTaken;
  std::string sanitizedContent;
  std::vector<std::string> quarantinedContent;
  double processingTimeMs = 0.0;
  double safetyScore = 1.0;

  bool hasCorruption(CorruptionType type) const;
  size_t countCorruption(CorruptionType type) const;
  bool hasAction(SanitizationAction action) const;

  nlohmann::json toJson() const;
};

// Samples attached to detections and log lines never exceed this many bytes
inline constexpr size_t kMaxSampleLength = 100;

// Cut to at most maxBytes without splitting a UTF-8 sequence
std::string truncateUtf8(std::string_view text, size_t maxBytes);

std::string makeSample(std::string_view text);

CorruptionDetection makeDetection(CorruptionType type, Severity severity,
                                  std::string location,
                                  std::string description,
                                  std::string_view sample, double confidence);

} // namespace logguard
