#pragma once

/// @file timeline_builder.h
/// @brief Ordered per-window emotion classification.

#include <functional>
#include <string>
#include <vector>

#include "analysis/cancellation.h"
#include "classify/classifier.h"
#include "core/segmenter.h"
#include "util/types.h"

namespace emotrace {

/// @brief Progress callback type for analysis progress reporting.
/// @param progress Progress value (0.0 to 1.0)
/// @param stage Current analysis stage name
using ProgressCallback = std::function<void(float progress, const char* stage)>;

/// @brief What the builder does when one window cannot be classified.
enum class FailurePolicy {
  Abort,        ///< Throw the ClassificationError of the earliest failing window
  Placeholder,  ///< Keep going and insert an unclassified gap entry
};

/// @brief Returns the name of a failure policy.
const char* failure_policy_name(FailurePolicy policy);

/// @brief Configuration for timeline building.
struct TimelineConfig {
  int n_threads = 1;                               ///< Worker threads (0 = hardware concurrency)
  FailurePolicy failure_policy = FailurePolicy::Abort;
  float score_tolerance = 1e-3f;                   ///< Allowed |sum(scores) - 1|
};

/// @brief Classification result for one window.
struct EmotionPrediction {
  Emotion emotion = Emotion::Neutral;  ///< Label with the highest probability
  float confidence = 0.0f;             ///< Probability of that label
  EmotionScores scores{};              ///< Full distribution in canonical order
};

/// @brief Builds a prediction from a score vector.
/// @details Ties resolve to the first label in canonical order.
EmotionPrediction make_prediction(const EmotionScores& scores);

/// @brief A window paired with its prediction.
struct TimelineEntry {
  size_t index = 0;              ///< Position in the timeline
  Window window;                 ///< Analyzed window
  EmotionPrediction prediction;  ///< Classification result
  std::string start_formatted;   ///< "MM:SS" of the window start
  std::string end_formatted;     ///< "MM:SS" of the window end
  bool classified = true;        ///< False for placeholder gaps

  float start_seconds() const { return window.start_seconds; }
  float end_seconds() const { return window.end_seconds; }
  Emotion emotion() const { return prediction.emotion; }
  float confidence() const { return prediction.confidence; }
};

/// @brief Drives a classifier over windows and emits an ordered timeline.
class TimelineBuilder {
 public:
  /// @brief Constructs a builder.
  /// @param classify Classifier capability
  /// @param config Builder configuration
  /// @throws EmotraceException if classify is empty or config is invalid
  explicit TimelineBuilder(ClassifyFn classify, const TimelineConfig& config = TimelineConfig());

  /// @brief Sets a callback invoked after every classified window.
  /// @details With several threads the callback runs on worker threads, one call at a time.
  ///          An exception it throws stops the remaining work and is rethrown from build().
  void set_progress_callback(ProgressCallback callback);

  /// @brief Classifies every window.
  /// @param windows Windows ordered by start time
  /// @param token Checked before each window
  /// @return Entries in window order regardless of completion order
  /// @throws ClassificationError under FailurePolicy::Abort
  /// @throws AnalysisCancelled if the token is cancelled before all windows finish
  std::vector<TimelineEntry> build(const std::vector<Window>& windows,
                                   const CancellationToken& token = CancellationToken()) const;

  /// @brief Classifies a single window and validates the result.
  /// @details Lets a caller retry one failed window.
  /// @throws ClassificationError carrying the window's time range
  EmotionPrediction classify_window(const Window& window) const;

  const TimelineConfig& config() const { return config_; }

 private:
  void validate_scores(const Window& window, const EmotionScores& scores) const;

  ClassifyFn classify_;
  TimelineConfig config_;
  ProgressCallback progress_callback_;
};

/// @brief Creates an unclassified gap entry for a window.
TimelineEntry make_gap_entry(size_t index, const Window& window);

}  // namespace emotrace
