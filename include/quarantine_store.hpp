#pragma once

#include "corruption_ledger.hpp"
#include <chrono>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace logguard {

struct QuarantineRecord {
  std::chrono::system_clock::time_point timestamp;
  size_t lineNumber = 0;
  std::string content; // raw line, as received
  std::string ruleId;  // first injection rule that fired
  SourceInfo source;

  nlohmann::json toJson() const;
};

// Append-only holding area for lines pulled out of sanitized output
class QuarantineStore {
public:
  QuarantineStore() = default;
  QuarantineStore(const QuarantineStore &) = delete;
  QuarantineStore &operator=(const QuarantineStore &) = delete;

  void add(QuarantineRecord record);

  size_t size() const;
  std::vector<QuarantineRecord> records() const;

  nlohmann::json toJson() const;

private:
  mutable std::mutex mutex_;
  std::vector<QuarantineRecord> records_;
};

} // namespace logguard
