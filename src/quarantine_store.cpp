#include "quarantine_store.hpp"
#include "component_logger.hpp"

namespace logguard {

nlohmann::json QuarantineRecord::toJson() const {
  nlohmann::json source_json = nlohmann::json::object();
  for (const auto &[key, value] : source) {
    source_json[key] = value;
  }
  return {{"timestamp_ms",
           std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
               .count()},
          {"line_number", lineNumber},
          {"rule_id", ruleId},
          {"content", content},
          {"source", source_json}};
}

void QuarantineStore::add(QuarantineRecord record) {
  QuarantineLogger::debug("Quarantined line {} (rule {})", record.lineNumber,
                          record.ruleId);
  std::lock_guard<std::mutex> lock(mutex_);
  records_.push_back(std::move(record));
}

size_t QuarantineStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

std::vector<QuarantineRecord> QuarantineStore::records() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}

nlohmann::json QuarantineStore::toJson() const {
  nlohmann::json items = nlohmann::json::array();
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &record : records_) {
    items.push_back(record.toJson());
  }
  return items;
}

} // namespace logguard
