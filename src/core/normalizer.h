#pragma once

/// @file normalizer.h
/// @brief Turns encoded or raw audio into a mono buffer at the analysis sample rate.

#include <cstddef>
#include <cstdint>
#include <string>

#include "core/audio_buffer.h"

namespace emotrace {

/// @brief What to do with audio longer than the configured ceiling.
enum class DurationPolicy {
  Reject,    ///< Throw EmotraceException(DurationExceeded)
  Truncate,  ///< Keep the first max_duration_sec seconds
};

/// @brief Returns the name of a duration policy.
const char* duration_policy_name(DurationPolicy policy);

/// @brief Configuration for audio normalization.
struct NormalizerConfig {
  int target_sample_rate = 16000;                  ///< Output sample rate in Hz
  float max_duration_sec = 600.0f;                 ///< Duration ceiling (<= 0 disables it)
  DurationPolicy duration_policy = DurationPolicy::Reject;
  size_t max_file_size = 50 * 1024 * 1024;         ///< Maximum input file size (0 = no limit)
};

/// @brief Decodes, downmixes and resamples audio for analysis.
class AudioNormalizer {
 public:
  /// @brief Constructs a normalizer.
  /// @param config Normalization configuration
  /// @throws EmotraceException if target_sample_rate is not positive
  explicit AudioNormalizer(const NormalizerConfig& config = NormalizerConfig());

  /// @brief Normalizes an encoded byte stream (WAV or MP3).
  /// @param data Encoded bytes
  /// @param size Number of bytes
  /// @return Mono buffer at the target sample rate
  /// @throws EmptyAudioError if the input or the decoded audio is empty
  /// @throws UnsupportedFormatError if the bytes cannot be decoded
  /// @throws EmotraceException(DurationExceeded) under the Reject policy
  AudioBuffer normalize(const uint8_t* data, size_t size) const;

  /// @brief Normalizes an encoded file.
  /// @param path Path to a WAV or MP3 file
  /// @throws EmotraceException(FileNotFound) if the file cannot be read
  AudioBuffer normalize_file(const std::string& path) const;

  /// @brief Normalizes interleaved PCM samples.
  /// @param interleaved Interleaved samples in [-1, 1]
  /// @param frames Number of sample frames
  /// @param channels Channel count
  /// @param sample_rate Sample rate of the input
  AudioBuffer normalize_samples(const float* interleaved, size_t frames, int channels,
                                int sample_rate) const;

  /// @brief Returns the configuration.
  const NormalizerConfig& config() const { return config_; }

 private:
  NormalizerConfig config_;
};

}  // namespace emotrace
