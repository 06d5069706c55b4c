#include "analysis/transition_detector.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "util/exception.h"

namespace emotrace {

TransitionDetector::TransitionDetector(const TransitionConfig& config,
                                       const SentimentMapper& sentiment)
    : config_(config), sentiment_(sentiment) {
  EMOTRACE_CHECK_MSG(
      std::isfinite(config_.significance_threshold) && config_.significance_threshold >= 0.0f,
      ErrorCode::InvalidParameter,
      "significance_threshold must be >= 0: " + std::to_string(config_.significance_threshold));
}

bool TransitionDetector::is_significant(Emotion from, Emotion to, float confidence_change) const {
  if (confidence_change == 0.0f) return false;
  if (std::abs(confidence_change) > config_.significance_threshold) return true;
  if (!config_.polarity_flip_significant) return false;

  Polarity a = sentiment_.emotion_polarity(from);
  Polarity b = sentiment_.emotion_polarity(to);
  return (a == Polarity::Positive && b == Polarity::Negative) ||
         (a == Polarity::Negative && b == Polarity::Positive);
}

std::vector<Transition> TransitionDetector::detect(
    const std::vector<TimelineEntry>& timeline) const {
  std::vector<Transition> transitions;

  const TimelineEntry* prev = nullptr;
  for (const auto& entry : timeline) {
    if (!entry.classified) continue;
    if (prev != nullptr && prev->emotion() != entry.emotion()) {
      Transition t;
      t.from_index = prev->index;
      t.to_index = entry.index;
      t.time_seconds = entry.start_seconds();
      t.time_formatted = entry.start_formatted;
      t.from_emotion = prev->emotion();
      t.to_emotion = entry.emotion();
      t.from_confidence = prev->confidence();
      t.to_confidence = entry.confidence();
      t.confidence_change = entry.confidence() - prev->confidence();
      t.is_significant = is_significant(t.from_emotion, t.to_emotion, t.confidence_change);
      transitions.push_back(std::move(t));
    }
    prev = &entry;
  }
  return transitions;
}

float stability_score(size_t entry_count, size_t transition_count) {
  if (entry_count == 0) return 1.0f;
  float rate = static_cast<float>(transition_count) / static_cast<float>(entry_count);
  return std::max(0.0f, 1.0f - rate);
}

}  // namespace emotrace
