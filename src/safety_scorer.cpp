#include "safety_scorer.hpp"
#include <algorithm>

namespace logguard {

SafetyScorer::SafetyScorer(const SanitizerConfig &config)
    : weights_(config.severityWeights), sizePenalty_(config.sizePenalty),
      sizeChangePenaltyRatio_(config.sizeChangePenaltyRatio) {}

double SafetyScorer::sizeChangeRatio(size_t originalSize,
                                     size_t sanitizedSize) {
  if (originalSize == 0) {
    return 0.0;
  }
  const size_t delta = originalSize > sanitizedSize
                           ? originalSize - sanitizedSize
                           : sanitizedSize - originalSize;
  return static_cast<double>(delta) / static_cast<double>(originalSize);
}

double SafetyScorer::score(const std::vector<CorruptionDetection> &detections,
                           size_t originalSize, size_t sanitizedSize) const {
  if (detections.empty()) {
    return 1.0;
  }

  double reduction = 0.0;
  for (const auto &detection : detections) {
    reduction += weights_.forSeverity(detection.severity) * detection.confidence;
  }
  if (sizeChangeRatio(originalSize, sanitizedSize) > sizeChangePenaltyRatio_) {
    reduction += sizePenalty_;
  }
  return std::clamp(1.0 - reduction, 0.0, 1.0);
}

} // namespace logguard
