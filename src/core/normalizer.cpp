#include "core/normalizer.h"

#include <algorithm>
#include <cmath>
#include <vector>

#include "core/audio_io.h"
#include "core/resample.h"
#include "util/exception.h"

namespace emotrace {

namespace {

/// @brief Averages interleaved channels into one.
std::vector<float> downmix(const float* interleaved, size_t frames, int channels) {
  std::vector<float> mono(frames);
  if (channels == 1) {
    std::copy(interleaved, interleaved + frames, mono.begin());
    return mono;
  }

  const float scale = 1.0f / static_cast<float>(channels);
  for (size_t i = 0; i < frames; ++i) {
    float sum = 0.0f;
    for (int ch = 0; ch < channels; ++ch) {
      sum += interleaved[i * channels + ch];
    }
    mono[i] = sum * scale;
  }
  return mono;
}

}  // namespace

const char* duration_policy_name(DurationPolicy policy) {
  return policy == DurationPolicy::Truncate ? "truncate" : "reject";
}

AudioNormalizer::AudioNormalizer(const NormalizerConfig& config) : config_(config) {
  EMOTRACE_CHECK_MSG(config_.target_sample_rate > 0, ErrorCode::InvalidParameter,
                     "target_sample_rate must be positive");
}

AudioBuffer AudioNormalizer::normalize(const uint8_t* data, size_t size) const {
  if (data == nullptr || size == 0) {
    throw EmptyAudioError("Audio input is empty (0 bytes)");
  }

  DecodedAudio decoded = decode_audio(data, size);
  return normalize_samples(decoded.samples.data(), decoded.frames(), decoded.channels,
                           decoded.sample_rate);
}

AudioBuffer AudioNormalizer::normalize_file(const std::string& path) const {
  std::vector<uint8_t> bytes = read_file(path, config_.max_file_size);
  return normalize(bytes.data(), bytes.size());
}

AudioBuffer AudioNormalizer::normalize_samples(const float* interleaved, size_t frames,
                                               int channels, int sample_rate) const {
  EMOTRACE_CHECK_MSG(channels > 0, ErrorCode::InvalidParameter,
                     "Channel count must be positive: " + std::to_string(channels));
  EMOTRACE_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter,
                     "Sample rate must be positive: " + std::to_string(sample_rate));

  if (frames == 0) {
    throw EmptyAudioError("Decoded audio has zero duration");
  }

  // Apply the ceiling before resampling so truncated audio is never converted in full
  const double duration = static_cast<double>(frames) / sample_rate;
  if (config_.max_duration_sec > 0.0f && duration > config_.max_duration_sec) {
    if (config_.duration_policy == DurationPolicy::Reject) {
      throw EmotraceException(ErrorCode::DurationExceeded,
                              "Audio duration " + std::to_string(duration) +
                                  "s exceeds maximum of " +
                                  std::to_string(config_.max_duration_sec) + "s");
    }
    frames = static_cast<size_t>(
        std::llround(static_cast<double>(config_.max_duration_sec) * sample_rate));
  }

  std::vector<float> mono = downmix(interleaved, frames, channels);
  std::vector<float> resampled = resample(mono, sample_rate, config_.target_sample_rate);

  if (resampled.empty()) {
    throw EmptyAudioError("Audio has zero duration after resampling");
  }
  return AudioBuffer::from_vector(std::move(resampled), config_.target_sample_rate);
}

}  // namespace emotrace
