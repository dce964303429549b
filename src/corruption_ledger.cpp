#include "corruption_ledger.hpp"
#include "component_logger.hpp"
#include "sanitizer_exceptions.hpp"
#include <algorithm>

namespace logguard {

nlohmann::json CorruptionStatistics::toJson() const {
  nlohmann::json types = nlohmann::json::object();
  for (const auto &[type, count] : counts) {
    types[toString(type)] = count;
  }

  nlohmann::json json = {{"total_corruptions_detected", totalDetections},
                         {"corruption_types", types},
                         {"sanitization_history_count", historySize},
                         {"quarantine_items", quarantineItems}};
  if (recent) {
    json["recent_performance"] = {
        {"avg_safety_score", recent->avgSafetyScore},
        {"avg_size_reduction_ratio", recent->avgSizeReductionRatio}};
  }
  return json;
}

CorruptionLedger::CorruptionLedger(const LedgerConfig &config)
    : config_(config) {
  auto validation = config_.validate();
  if (!validation.isValid) {
    throw ValidationException(
        ErrorCode::INVALID_RANGE,
        "Invalid statistics configuration: " + validation.errors.front(),
        "statistics");
  }
  for (auto type : kAllCorruptionTypes) {
    counts_[type] = 0;
  }
}

void CorruptionLedger::record(const SanitizationResult &result,
                              const SourceInfo &source) {
  HistoryEntry entry{std::chrono::system_clock::now(),
                     source,
                     result.originalSize,
                     result.sanitizedSize,
                     result.corruptionsDetected.size(),
                     result.safetyScore};

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &detection : result.corruptionsDetected) {
    ++counts_[detection.type];
  }
  history_.push_back(std::move(entry));
  while (history_.size() > config_.historyCapacity) {
    history_.pop_front();
  }
}

CorruptionStatistics CorruptionLedger::statistics() const {
  CorruptionStatistics stats;
  std::lock_guard<std::mutex> lock(mutex_);

  stats.counts = counts_;
  for (const auto &[type, count] : counts_) {
    stats.totalDetections += count;
  }
  stats.historySize = history_.size();

  if (!history_.empty()) {
    const size_t window = std::min(config_.statisticsWindow, history_.size());
    RecentPerformance recent;
    for (auto it = history_.end() - static_cast<std::ptrdiff_t>(window);
         it != history_.end(); ++it) {
      recent.avgSafetyScore += it->safetyScore;
      if (it->originalSize > 0) {
        recent.avgSizeReductionRatio +=
            (static_cast<double>(it->originalSize) -
             static_cast<double>(it->sanitizedSize)) /
            static_cast<double>(it->originalSize);
      }
    }
    recent.avgSafetyScore /= static_cast<double>(window);
    recent.avgSizeReductionRatio /= static_cast<double>(window);
    stats.recent = recent;
  }
  return stats;
}

std::deque<HistoryEntry> CorruptionLedger::history() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return history_;
}

size_t CorruptionLedger::count(CorruptionType type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = counts_.find(type);
  return it == counts_.end() ? 0 : it->second;
}

void CorruptionLedger::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &[type, count] : counts_) {
    count = 0;
  }
  history_.clear();
  LEDGER_LOG_DEBUG("Ledger reset");
}

} // namespace logguard
