#pragma once

/// @file segmenter.h
/// @brief Cuts a buffer into fixed-length overlapping analysis windows.

#include <cstddef>
#include <vector>

#include "core/audio_buffer.h"

namespace emotrace {

/// @brief Configuration for segmentation.
struct SegmenterConfig {
  float window_sec = 2.0f;         ///< Window length in seconds
  float overlap_sec = 1.0f;        ///< Overlap between consecutive windows in seconds
  float min_tail_fraction = 0.5f;  ///< Shortest trailing window as a fraction of window_sec
};

/// @brief One analysis window.
/// @details Times are derived from sample indices, never accumulated.
struct Window {
  size_t start_sample = 0;  ///< First sample (inclusive)
  size_t end_sample = 0;    ///< Last sample (exclusive)
  float start_seconds = 0.0f;  ///< start_sample / sample_rate
  float end_seconds = 0.0f;    ///< end_sample / sample_rate
  AudioBuffer audio;    ///< Zero-copy view of the window's samples

  /// @brief Returns window length in samples.
  size_t length() const { return end_sample - start_sample; }

  /// @brief Returns window duration in seconds.
  float duration() const { return end_seconds - start_seconds; }
};

/// @brief Segmenter producing deterministic overlapping windows.
/// @details Full windows start at k * step samples, step = window - overlap. When audio
/// remains past the last full window, one shorter window [next_start, end) is emitted if
/// it is at least min_tail_fraction of a window long; otherwise the remainder is dropped.
class Segmenter {
 public:
  /// @brief Constructs a segmenter.
  /// @param config Segmentation configuration
  explicit Segmenter(const SegmenterConfig& config = SegmenterConfig());

  /// @brief Segments a buffer.
  /// @param buffer Normalized audio
  /// @return Windows ordered by start time
  /// @throws InvalidWindowConfigError unless 0 < overlap < window <= duration
  std::vector<Window> segment(const AudioBuffer& buffer) const;

  /// @brief Returns the configuration.
  const SegmenterConfig& config() const { return config_; }

 private:
  SegmenterConfig config_;
};

/// @brief Segments a buffer with the default tail policy.
/// @param buffer Normalized audio
/// @param window_sec Window length in seconds
/// @param overlap_sec Overlap in seconds
/// @return Windows ordered by start time
std::vector<Window> segment(const AudioBuffer& buffer, float window_sec, float overlap_sec);

}  // namespace emotrace
