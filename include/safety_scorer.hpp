#pragma once

#include "config_manager.hpp"
#include "corruption_types.hpp"
#include <vector>

namespace logguard {

/**
 * Collapses a result's detections into one score in [0, 1], 1.0 meaning
 * nothing was found. Each detection subtracts its severity weight scaled
 * by its confidence; a large size change costs a flat penalty on top.
 */
class SafetyScorer {
public:
  explicit SafetyScorer(const SanitizerConfig &config);

  double score(const std::vector<CorruptionDetection> &detections,
               size_t originalSize, size_t sanitizedSize) const;

  // |original - sanitized| / original, 0 for empty input
  static double sizeChangeRatio(size_t originalSize, size_t sanitizedSize);

private:
  SeverityWeights weights_;
  double sizePenalty_;
  double sizeChangePenaltyRatio_;
};

} // namespace logguard
