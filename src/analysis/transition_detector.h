#pragma once

/// @file transition_detector.h
/// @brief Detects changes of dominant emotion along a timeline.

#include <string>
#include <vector>

#include "analysis/sentiment_mapper.h"
#include "analysis/timeline_builder.h"
#include "util/types.h"

namespace emotrace {

/// @brief Configuration for transition detection.
struct TransitionConfig {
  float significance_threshold = 0.15f;   ///< |confidence_change| must exceed this
  bool polarity_flip_significant = true;  ///< Positive <-> negative crossings are significant
};

/// @brief A change of dominant emotion between two classified entries.
struct Transition {
  size_t from_index = 0;              ///< Timeline index of the earlier entry
  size_t to_index = 0;                ///< Timeline index of the later entry
  float time_seconds = 0.0f;          ///< Start of the later entry
  std::string time_formatted;         ///< "MM:SS" of the later entry
  Emotion from_emotion = Emotion::Neutral;
  Emotion to_emotion = Emotion::Neutral;
  float from_confidence = 0.0f;
  float to_confidence = 0.0f;
  float confidence_change = 0.0f;     ///< to_confidence - from_confidence
  bool is_significant = false;
};

/// @brief Scans a timeline for emotion changes.
/// @details Adjacent classified entries are compared; gap entries are skipped so the
/// comparison spans them. A change is significant when |confidence_change| is strictly
/// greater than the threshold, or when the two labels lie on opposite sides of the
/// sentiment thresholds. A change with confidence_change == 0 is never significant.
class TransitionDetector {
 public:
  /// @brief Constructs a detector.
  /// @param config Detection configuration
  /// @param sentiment Sentiment policy used for polarity crossings
  /// @throws EmotraceException(InvalidParameter) if the threshold is negative or not finite
  explicit TransitionDetector(const TransitionConfig& config = TransitionConfig(),
                              const SentimentMapper& sentiment = SentimentMapper());

  /// @brief Detects transitions in temporal order.
  /// @param timeline Entries ordered by start time
  /// @return Transitions (empty for fewer than two classified entries)
  std::vector<Transition> detect(const std::vector<TimelineEntry>& timeline) const;

  /// @brief Applies the significance rule.
  bool is_significant(Emotion from, Emotion to, float confidence_change) const;

  const TransitionConfig& config() const { return config_; }

 private:
  TransitionConfig config_;
  SentimentMapper sentiment_;
};

/// @brief Returns max(0, 1 - transitions / entries), or 1 for an empty timeline.
float stability_score(size_t entry_count, size_t transition_count);

}  // namespace emotrace
