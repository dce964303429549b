#pragma once

#include "config_manager.hpp"
#include "corruption_types.hpp"
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace logguard {

// Caller-supplied metadata about where content came from; audit only
using SourceInfo = std::unordered_map<std::string, std::string>;

struct HistoryEntry {
  std::chrono::system_clock::time_point timestamp;
  SourceInfo source;
  size_t originalSize = 0;
  size_t sanitizedSize = 0;
  size_t detectionCount = 0;
  double safetyScore = 1.0;
};

struct RecentPerformance {
  double avgSafetyScore = 0.0;
  double avgSizeReductionRatio = 0.0;
};

struct CorruptionStatistics {
  std::map<CorruptionType, size_t> counts; // every type, zero included
  size_t totalDetections = 0;
  size_t historySize = 0;
  size_t quarantineItems = 0;
  std::optional<RecentPerformance> recent; // absent until something is recorded

  nlohmann::json toJson() const;
};

/**
 * Per-type detection counters plus a bounded history of result summaries.
 * Owned by whoever builds the sanitizer and shared by reference; several
 * sanitizers may feed the same ledger concurrently.
 */
class CorruptionLedger {
public:
  explicit CorruptionLedger(const LedgerConfig &config = LedgerConfig{});

  CorruptionLedger(const CorruptionLedger &) = delete;
  CorruptionLedger &operator=(const CorruptionLedger &) = delete;

  void record(const SanitizationResult &result, const SourceInfo &source);

  CorruptionStatistics statistics() const;

  std::deque<HistoryEntry> history() const;
  size_t count(CorruptionType type) const;

  void reset();

  const LedgerConfig &getConfig() const { return config_; }

private:
  LedgerConfig config_;
  mutable std::mutex mutex_;
  std::map<CorruptionType, size_t> counts_;
  std::deque<HistoryEntry> history_;
};

} // namespace logguard
