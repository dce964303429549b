#pragma once

#include "compression_detector.hpp"
#include "config_manager.hpp"
#include "content_filters.hpp"
#include "corruption_ledger.hpp"
#include "corruption_types.hpp"
#include "encoding_normalizer.hpp"
#include "json_repair.hpp"
#include "pattern_rules.hpp"
#include "quarantine_store.hpp"
#include "safety_scorer.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace logguard {

/**
 * Entry point of the pipeline. Takes raw bytes or text, returns a fully
 * populated SanitizationResult and records its summary in the ledger.
 *
 * Order of work for one call:
 *   encoding normalisation -> whole-content passes (size, binary, NUL,
 *   control characters) -> per line: length guard, injection quarantine,
 *   suspicious-pattern escaping, JSON repair, compressed blob handling ->
 *   removal of kept lines that repeat quarantined text -> reassembly ->
 *   scoring -> ledger update.
 *
 * Hostile input never throws. Only an invalid configuration does, from the
 * constructor.
 */
class LogSanitizer {
public:
  LogSanitizer(const SanitizerConfig &config, CorruptionLedger &ledger,
               QuarantineStore *quarantine = nullptr);

  LogSanitizer(const LogSanitizer &) = delete;
  LogSanitizer &operator=(const LogSanitizer &) = delete;

  SanitizationResult sanitizeBytes(std::string_view bytes,
                                   const SourceInfo &source = {}) const;

  // Valid UTF-8 text skips encoding normalisation. Text that is not valid
  // UTF-8 is treated like raw bytes.
  SanitizationResult sanitize(std::string_view text,
                              const SourceInfo &source = {}) const;

  // Each entry is sanitized independently, results in input order
  std::vector<SanitizationResult>
  sanitizeBatch(const std::vector<std::string> &entries,
                const SourceInfo &source = {}) const;

  CorruptionStatistics getCorruptionStatistics() const;

  const SanitizerConfig &getConfig() const { return config_; }

private:
  SanitizerConfig config_;
  CorruptionLedger &ledger_;
  QuarantineStore *quarantine_;

  const PatternRuleSet &rules_;
  EncodingNormalizer normalizer_;
  ContentFilters filters_;
  JsonRepair jsonRepair_;
  CompressionDetector compression_;
  SafetyScorer scorer_;

  using NumberedLine = std::pair<size_t, std::string>;

  SanitizationResult run(std::string_view input, bool decode,
                         const SourceInfo &source) const;

  std::string processLines(const std::string &content,
                           const SourceInfo &source,
                           SanitizationResult &result) const;

  // Returns false when the line was quarantined and must be dropped. Raw
  // quarantined text is appended to `quarantined`.
  bool processLine(std::string &line, size_t lineNumber,
                   const SourceInfo &source, SanitizationResult &result,
                   std::vector<std::string> &quarantined) const;

  // Removes kept lines that still contain quarantined raw text
  void dropQuarantinedEchoes(std::vector<NumberedLine> &kept,
                             const std::vector<std::string> &quarantined,
                             SanitizationResult &result) const;

  void enforceLineLength(std::string &line, size_t lineNumber,
                         SanitizationResult &result) const;
  bool quarantineIfInjected(const std::string &line, size_t lineNumber,
                            const SourceInfo &source,
                            SanitizationResult &result) const;
  void escapeIfSuspicious(std::string &line, size_t lineNumber,
                          SanitizationResult &result) const;
};

} // namespace logguard
