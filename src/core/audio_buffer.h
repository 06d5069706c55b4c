#pragma once

/// @file audio_buffer.h
/// @brief Immutable mono sample buffer with zero-copy slicing.

#include <cstddef>
#include <memory>
#include <vector>

namespace emotrace {

/// @brief Normalized mono audio at a fixed sample rate.
/// @details Samples are never modified after construction. Slices share the
/// underlying storage, so windows cut from a buffer cost no copies and stay valid
/// as long as any slice is alive.
class AudioBuffer {
 public:
  /// @brief Default constructor creates an empty buffer.
  AudioBuffer();

  /// @brief Creates a buffer from existing samples.
  /// @param samples Pointer to sample data (will be copied)
  /// @param size Number of samples
  /// @param sample_rate Sample rate in Hz
  /// @throws EmotraceException if sample_rate is not positive
  static AudioBuffer from_buffer(const float* samples, size_t size, int sample_rate);

  /// @brief Creates a buffer from a vector of samples.
  /// @param samples Vector of samples (will be moved)
  /// @param sample_rate Sample rate in Hz
  /// @throws EmotraceException if sample_rate is not positive
  static AudioBuffer from_vector(std::vector<float> samples, int sample_rate);

  /// @brief Returns pointer to sample data.
  const float* data() const;

  /// @brief Returns number of samples.
  size_t size() const { return length_; }

  /// @brief Returns sample rate in Hz.
  int sample_rate() const { return sample_rate_; }

  /// @brief Returns duration in seconds.
  float duration() const;

  /// @brief Returns true if the buffer holds no samples.
  bool empty() const { return length_ == 0; }

  /// @brief Creates a slice by sample indices (shared storage, zero-copy).
  /// @param start_sample Start sample index (inclusive)
  /// @param end_sample End sample index (exclusive, clamped to size)
  /// @return Buffer sharing the same storage
  AudioBuffer slice_samples(size_t start_sample, size_t end_sample) const;

  /// @brief Access sample by index.
  /// @throws EmotraceException if index is out of range
  float operator[](size_t index) const;

  const float* begin() const { return data(); }
  const float* end() const { return data() + size(); }

 private:
  AudioBuffer(std::shared_ptr<const std::vector<float>> storage, size_t offset, size_t length,
              int sample_rate);

  std::shared_ptr<const std::vector<float>> storage_;
  size_t offset_;
  size_t length_;
  int sample_rate_;
};

}  // namespace emotrace
