#include "log_sanitizer.hpp"
#include "component_logger.hpp"
#include "sanitizer_exceptions.hpp"
#include <algorithm>
#include <chrono>
#include <map>
#include <set>
#include <sstream>

namespace logguard {

namespace {

constexpr size_t kSniffHeaderBytes = 16;
constexpr size_t kDescribedSuspiciousRules = 3;

bool isBlank(const std::string &line) {
  return std::all_of(line.begin(), line.end(), [](char c) {
    return c == ' ' || c == '\t' || c == '\r';
  });
}

std::vector<std::string> splitLines(const std::string &content) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (true) {
    size_t end = content.find('\n', start);
    if (end == std::string::npos) {
      lines.push_back(content.substr(start));
      break;
    }
    lines.push_back(content.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

} // namespace

LogSanitizer::LogSanitizer(const SanitizerConfig &config,
                           CorruptionLedger &ledger, QuarantineStore *quarantine)
    : config_(config), ledger_(ledger), quarantine_(quarantine),
      rules_(PatternRuleSet::instance()), filters_(config),
      jsonRepair_(config), compression_(config), scorer_(config) {
  auto validation = config_.validate();
  if (!validation.isValid) {
    std::ostringstream errors;
    for (size_t i = 0; i < validation.errors.size(); ++i) {
      errors << (i > 0 ? "; " : "") << validation.errors[i];
    }
    SANITIZER_LOG_ERROR("Rejected sanitizer configuration: {}", errors.str());
    throw ValidationException(ErrorCode::INVALID_RANGE,
                              "Invalid sanitizer configuration: " +
                                  errors.str(),
                              "sanitizer");
  }
  for (const auto &warning : validation.warnings) {
    SANITIZER_LOG_WARN("Sanitizer configuration: {}", warning);
  }
  SANITIZER_LOG_DEBUG("Sanitizer ready with rule set {}",
                      PatternRuleSet::kVersion);
}

SanitizationResult LogSanitizer::sanitize(std::string_view text,
                                          const SourceInfo &source) const {
  if (!EncodingNormalizer::isValidUtf8(text)) {
    return sanitizeBytes(text, source);
  }
  return run(text, false, source);
}

SanitizationResult LogSanitizer::sanitizeBytes(std::string_view bytes,
                                               const SourceInfo &source) const {
  return run(bytes, true, source);
}

SanitizationResult LogSanitizer::run(std::string_view input, bool decode,
                                     const SourceInfo &source) const {
  const auto start = std::chrono::steady_clock::now();

  SanitizationResult result;
  result.originalSize = input.size();

  std::string text;
  if (decode) {
    NormalizedText normalized = normalizer_.normalize(input);
    for (auto &detection : normalized.detections) {
      result.corruptionsDetected.push_back(std::move(detection));
    }
    for (auto &action : normalized.actions) {
      result.actionsTaken.push_back(std::move(action));
    }
    text = std::move(normalized.text);
  } else {
    text = std::string(input);
  }

  std::string content = filters_.apply(
      std::move(text), input.substr(0, kSniffHeaderBytes), result);

  result.sanitizedContent = processLines(content, source, result);
  result.sanitizedSize = result.sanitizedContent.size();
  result.safetyScore = scorer_.score(result.corruptionsDetected,
                                     result.originalSize, result.sanitizedSize);

  result.processingTimeMs = std::chrono::duration<double, std::milli>(
                                std::chrono::steady_clock::now() - start)
                                .count();

  ledger_.record(result, source);

  SanitizerLogger::logPerformance(
      "sanitize", result.processingTimeMs,
      {{"original_size", std::to_string(result.originalSize)},
       {"sanitized_size", std::to_string(result.sanitizedSize)},
       {"detections", std::to_string(result.corruptionsDetected.size())}});
  return result;
}

std::vector<SanitizationResult>
LogSanitizer::sanitizeBatch(const std::vector<std::string> &entries,
                            const SourceInfo &source) const {
  std::vector<SanitizationResult> results;
  results.reserve(entries.size());
  for (const auto &entry : entries) {
    results.push_back(sanitizeBytes(entry, source));
  }
  SANITIZER_LOG_DEBUG("Sanitized batch of {} entries", entries.size());
  return results;
}

CorruptionStatistics LogSanitizer::getCorruptionStatistics() const {
  CorruptionStatistics stats = ledger_.statistics();
  stats.quarantineItems = quarantine_ != nullptr ? quarantine_->size() : 0;
  return stats;
}

std::string LogSanitizer::processLines(const std::string &content,
                                       const SourceInfo &source,
                                       SanitizationResult &result) const {
  std::vector<std::string> lines = splitLines(content);
  std::vector<std::string> quarantined;

  std::vector<NumberedLine> kept;
  kept.reserve(lines.size());
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string &line = lines[i];
    if (!isBlank(line) &&
        !processLine(line, i + 1, source, result, quarantined)) {
      continue;
    }
    kept.emplace_back(i + 1, std::move(line));
  }
  dropQuarantinedEchoes(kept, quarantined, result);

  std::string output;
  output.reserve(content.size());
  for (size_t i = 0; i < kept.size(); ++i) {
    if (i > 0) {
      output += '\n';
    }
    output += kept[i].second;
  }
  return output;
}

bool LogSanitizer::processLine(std::string &line, size_t lineNumber,
                               const SourceInfo &source,
                               SanitizationResult &result,
                               std::vector<std::string> &quarantined) const {
  enforceLineLength(line, lineNumber, result);

  if (quarantineIfInjected(line, lineNumber, source, result)) {
    quarantined.push_back(line);
    return false;
  }
  escapeIfSuspicious(line, lineNumber, result);

  if (JsonRepair::looksLikeJson(line)) {
    jsonRepair_.process(line, lineNumber, result);
  }

  if (!compression_.process(line, lineNumber, result) ||
      !config_.rescreenDecompressed) {
    return true;
  }

  // The payload may carry several records; each is screened on its own
  std::string survivors;
  bool any = false;
  for (auto &record : splitLines(line)) {
    if (!isBlank(record) &&
        quarantineIfInjected(record, lineNumber, source, result)) {
      quarantined.push_back(std::move(record));
      continue;
    }
    if (any) {
      survivors += '\n';
    }
    survivors += record;
    any = true;
  }
  line = std::move(survivors);
  return any;
}

void LogSanitizer::dropQuarantinedEchoes(
    std::vector<NumberedLine> &kept,
    const std::vector<std::string> &quarantined,
    SanitizationResult &result) const {
  if (quarantined.empty()) {
    return;
  }

  std::vector<NumberedLine> clean;
  clean.reserve(kept.size());
  for (auto &entry : kept) {
    auto echoed = std::find_if(
        quarantined.begin(), quarantined.end(), [&](const std::string &raw) {
          return entry.second.find(raw) != std::string::npos;
        });
    if (echoed == quarantined.end()) {
      clean.push_back(std::move(entry));
      continue;
    }

    const std::string lineNumber = std::to_string(entry.first);
    result.corruptionsDetected.push_back(makeDetection(
        CorruptionType::INJECTION_ATTEMPT, Severity::CRITICAL,
        "line_" + lineNumber,
        "Line repeats quarantined content: " + makeSample(*echoed),
        entry.second, 0.9));
    result.actionsTaken.emplace_back(SanitizationAction::REMOVED,
                                     "Removed line " + lineNumber +
                                         " containing quarantined content");
    SANITIZER_LOG_WARN("Removed line {} containing quarantined content",
                       entry.first);
  }
  kept = std::move(clean);
}

void LogSanitizer::enforceLineLength(std::string &line, size_t lineNumber,
                                     SanitizationResult &result) const {
  const auto limit = static_cast<size_t>(config_.maxLineLength);
  if (line.size() <= limit) {
    return;
  }

  const size_t originalLength = line.size();
  result.corruptionsDetected.push_back(makeDetection(
      CorruptionType::OVERSIZED_ENTRY, Severity::MEDIUM,
      "line_" + std::to_string(lineNumber),
      "Line length " + std::to_string(originalLength) +
          " exceeds maximum of " + std::to_string(limit),
      line, 1.0));

  line = truncateUtf8(line, limit);
  result.actionsTaken.emplace_back(
      SanitizationAction::TRUNCATED,
      "Truncated line " + std::to_string(lineNumber) + " from " +
          std::to_string(originalLength) + " to " +
          std::to_string(line.size()) + " bytes");
}

bool LogSanitizer::quarantineIfInjected(const std::string &line,
                                        size_t lineNumber,
                                        const SourceInfo &source,
                                        SanitizationResult &result) const {
  std::vector<RuleMatch> matches = rules_.matchInjection(line);
  if (matches.empty()) {
    return false;
  }

  const PatternRule &firstRule = *matches.front().rule;
  std::set<std::string> categories;
  for (const auto &match : matches) {
    categories.insert(toString(match.rule->category));
  }
  std::ostringstream description;
  description << "Injection attempt matched rule " << firstRule.id
              << " (categories:";
  for (const auto &category : categories) {
    description << ' ' << category;
  }
  description << ')';

  const std::string location = "line_" + std::to_string(lineNumber);
  result.corruptionsDetected.push_back(
      makeDetection(CorruptionType::INJECTION_ATTEMPT, Severity::CRITICAL,
                    location, description.str(),
                    line.substr(matches.front().position), 0.9));
  result.quarantinedContent.push_back("Line " + std::to_string(lineNumber) +
                                      ": " + line);
  result.actionsTaken.emplace_back(
      SanitizationAction::QUARANTINED,
      "Quarantined line " + std::to_string(lineNumber) + " (rule " +
          firstRule.id + ")");

  if (quarantine_ != nullptr) {
    quarantine_->add(QuarantineRecord{std::chrono::system_clock::now(),
                                      lineNumber, line, firstRule.id, source});
  }

  SanitizerLogger::warnWithContext(
      "Quarantined line matching injection rule",
      {{"line", std::to_string(lineNumber)},
       {"rule", firstRule.id},
       {"sample", makeSample(line)}});
  return true;
}

void LogSanitizer::escapeIfSuspicious(std::string &line, size_t lineNumber,
                                      SanitizationResult &result) const {
  std::vector<RuleMatch> matches = rules_.findSuspicious(line);
  const double score =
      static_cast<double>(matches.size()) * config_.suspiciousMatchWeight;
  if (score <= config_.suspiciousPatternThreshold) {
    return;
  }

  // Per-rule counts in table order
  std::map<std::string, size_t> perRule;
  std::vector<std::string> order;
  for (const auto &match : matches) {
    if (perRule[match.rule->id]++ == 0) {
      order.push_back(match.rule->id);
    }
  }
  std::ostringstream description;
  description << "Suspicious patterns: ";
  for (size_t i = 0; i < order.size() && i < kDescribedSuspiciousRules; ++i) {
    description << (i > 0 ? ", " : "") << order[i] << '(' << perRule[order[i]]
                << ')';
  }

  result.corruptionsDetected.push_back(makeDetection(
      CorruptionType::SUSPICIOUS_PATTERN, Severity::MEDIUM,
      "line_" + std::to_string(lineNumber), description.str(), line,
      std::min(1.0, score)));

  line = PatternRuleSet::escapeSuspicious(line);
  result.actionsTaken.emplace_back(SanitizationAction::ESCAPED,
                                   "Escaped suspicious patterns on line " +
                                       std::to_string(lineNumber));
}

} // namespace logguard
