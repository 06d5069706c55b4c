#pragma once

/// @file prosodic_classifier.h
/// @brief Built-in emotion classifier driven by prosodic features.

#include <cstddef>

#include "util/types.h"

namespace emotrace {

/// @brief Configuration for prosodic feature extraction.
struct ProsodicConfig {
  int frame_length = 512;          ///< Analysis frame length in samples
  int hop_length = 256;            ///< Hop between frames in samples
  float min_pitch_hz = 70.0f;      ///< Lowest pitch searched
  float max_pitch_hz = 400.0f;     ///< Highest pitch searched
  float voicing_threshold = 0.3f;  ///< Normalized autocorrelation peak needed for a voiced frame
  float silence_rms = 1e-4f;       ///< Frames below this RMS are treated as silence
};

/// @brief Prosodic features of one window.
struct ProsodicFeatures {
  float energy_mean = 0.0f;        ///< Mean frame RMS
  float energy_std = 0.0f;         ///< Standard deviation of frame RMS
  float pitch_mean = 0.0f;         ///< Mean pitch of voiced frames in Hz (0 if unvoiced)
  float pitch_std = 0.0f;          ///< Standard deviation of voiced pitch in Hz
  float spectral_centroid = 0.0f;  ///< Mean spectral centroid in Hz
  float zero_crossing_rate = 0.0f; ///< Zero crossings per sample
  float voiced_ratio = 0.0f;       ///< Fraction of non-silent frames that are voiced
};

/// @brief Rule-derived linear classifier over prosodic features.
/// @details Features are squashed to [0, 1], scored by a fixed 7x6 linear layer and
/// passed through softmax. The result is deterministic and the object is stateless after
/// construction, so one instance can serve concurrent callers.
class ProsodicClassifier {
 public:
  explicit ProsodicClassifier(const ProsodicConfig& config = ProsodicConfig());

  /// @brief Extracts prosodic features.
  /// @param samples Mono samples
  /// @param size Number of samples
  /// @param sample_rate Sample rate in Hz
  /// @throws EmotraceException if size is 0 or sample_rate is not positive
  ProsodicFeatures extract(const float* samples, size_t size, int sample_rate) const;

  /// @brief Maps features to class probabilities.
  EmotionScores score(const ProsodicFeatures& features) const;

  /// @brief Classifies samples (extract + score).
  EmotionScores classify(const float* samples, size_t size, int sample_rate) const;

  EmotionScores operator()(const float* samples, size_t size, int sample_rate) const {
    return classify(samples, size, sample_rate);
  }

  const ProsodicConfig& config() const { return config_; }

 private:
  ProsodicConfig config_;
};

}  // namespace emotrace
