#include "classify/prosodic_classifier.h"

#include <Eigen/Core>
#include <algorithm>
#include <cmath>
#include <vector>

#include "core/fft.h"
#include "core/window.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace emotrace {

namespace {

constexpr int kFeatureCount = 6;

using WeightMatrix = Eigen::Matrix<float, static_cast<int>(kEmotionCount), kFeatureCount,
                                   Eigen::RowMajor>;
using FeatureVector = Eigen::Matrix<float, kFeatureCount, 1>;
using LogitVector = Eigen::Matrix<float, static_cast<int>(kEmotionCount), 1>;

/// @brief Linear layer weights. Rows follow Emotion order, columns follow
/// [energy, energy_var, pitch, pitch_var, brightness, noisiness].
const WeightMatrix& weights() {
  static const WeightMatrix w = [] {
    WeightMatrix m;
    m << 1.5f, 0.3f, 1.5f, 0.5f, 0.8f, -0.3f,     // happy
        -1.5f, -0.5f, -1.2f, -0.5f, -0.8f, -0.3f,  // sad
        2.0f, 0.8f, 0.3f, 1.5f, 0.5f, 0.6f,        // angry
        -0.3f, -1.0f, 0.0f, -1.0f, 0.0f, -0.2f,    // neutral
        -0.5f, 0.8f, 1.5f, 1.0f, 0.3f, 0.4f,       // fear
        0.2f, 0.2f, -0.8f, 0.3f, -0.5f, 0.8f,      // disgust
        1.0f, 1.2f, 1.0f, 0.8f, 0.6f, 0.0f;        // surprise
    return m;
  }();
  return w;
}

const LogitVector& bias() {
  static const LogitVector b = [] {
    LogitVector v = LogitVector::Zero();
    v(static_cast<int>(Emotion::Neutral)) = 0.5f;
    return v;
  }();
  return b;
}

int next_pow2(int n) {
  int p = 1;
  while (p < n) p <<= 1;
  return p;
}

/// @brief Picks the autocorrelation peak inside the pitch lag range.
/// @return Pitch in Hz, or 0 if the frame is unvoiced
float frame_pitch(const std::vector<float>& ac, int frame_len, int sample_rate,
                  const ProsodicConfig& config) {
  if (ac[0] <= 0.0f) return 0.0f;

  int min_lag = std::max(1, static_cast<int>(std::floor(sample_rate / config.max_pitch_hz)));
  int max_lag = std::min(frame_len - 1,
                         static_cast<int>(std::ceil(sample_rate / config.min_pitch_hz)));
  if (min_lag >= max_lag) return 0.0f;

  int best_lag = min_lag;
  for (int lag = min_lag + 1; lag <= max_lag; ++lag) {
    if (ac[lag] > ac[best_lag]) best_lag = lag;
  }
  if (ac[best_lag] / ac[0] < config.voicing_threshold) return 0.0f;
  return static_cast<float>(sample_rate) / static_cast<float>(best_lag);
}

}  // namespace

ProsodicClassifier::ProsodicClassifier(const ProsodicConfig& config) : config_(config) {
  EMOTRACE_CHECK_MSG(config_.frame_length >= 2 && config_.hop_length > 0,
                     ErrorCode::InvalidParameter, "frame_length and hop_length must be positive");
  EMOTRACE_CHECK_MSG(config_.min_pitch_hz > 0.0f && config_.min_pitch_hz < config_.max_pitch_hz,
                     ErrorCode::InvalidParameter, "pitch range must satisfy 0 < min < max");
}

ProsodicFeatures ProsodicClassifier::extract(const float* samples, size_t size,
                                             int sample_rate) const {
  EMOTRACE_CHECK_MSG(samples != nullptr && size > 0, ErrorCode::EmptyAudio,
                     "Cannot classify an empty window");
  EMOTRACE_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter,
                     "Sample rate must be positive");

  const int frame_len = static_cast<int>(std::min(size, static_cast<size_t>(config_.frame_length)));
  const int n_fft = next_pow2(std::max(2, frame_len * 2));

  // One FFT per call keeps concurrent callers independent
  FFT fft(n_fft);
  const std::vector<float>& window = hann_window_cached(frame_len);
  std::vector<float> frame(frame_len);
  std::vector<float> magnitude(fft.n_bins());
  std::vector<float> ac(frame_len);

  std::vector<float> energies;
  std::vector<float> pitches;
  double centroid_sum = 0.0;
  int sounding_frames = 0;

  const float bin_hz = static_cast<float>(sample_rate) / static_cast<float>(n_fft);
  for (size_t pos = 0; pos + frame_len <= size; pos += config_.hop_length) {
    const float* src = samples + pos;

    double sum_sq = 0.0;
    for (int i = 0; i < frame_len; ++i) sum_sq += static_cast<double>(src[i]) * src[i];
    float rms = static_cast<float>(std::sqrt(sum_sq / frame_len));
    energies.push_back(rms);
    if (rms < config_.silence_rms) continue;
    ++sounding_frames;

    apply_window(src, window.data(), frame_len, frame.data());

    fft.magnitude(frame.data(), frame_len, magnitude.data());
    double weighted = 0.0;
    double total = 0.0;
    for (int k = 0; k < fft.n_bins(); ++k) {
      weighted += static_cast<double>(magnitude[k]) * k * bin_hz;
      total += magnitude[k];
    }
    if (total > 0.0) centroid_sum += weighted / total;

    fft.autocorrelation(frame.data(), frame_len, ac.data());
    float pitch = frame_pitch(ac, frame_len, sample_rate, config_);
    if (pitch > 0.0f) pitches.push_back(pitch);
  }

  size_t crossings = 0;
  for (size_t i = 1; i < size; ++i) {
    if ((samples[i - 1] >= 0.0f) != (samples[i] >= 0.0f)) ++crossings;
  }

  ProsodicFeatures f;
  f.energy_mean = mean(energies.data(), energies.size());
  f.energy_std = stddev(energies.data(), energies.size());
  f.pitch_mean = mean(pitches.data(), pitches.size());
  f.pitch_std = stddev(pitches.data(), pitches.size());
  f.spectral_centroid =
      sounding_frames > 0 ? static_cast<float>(centroid_sum / sounding_frames) : 0.0f;
  f.zero_crossing_rate = size > 1 ? static_cast<float>(crossings) / (size - 1) : 0.0f;
  f.voiced_ratio = sounding_frames > 0
                       ? static_cast<float>(pitches.size()) / static_cast<float>(sounding_frames)
                       : 0.0f;
  return f;
}

EmotionScores ProsodicClassifier::score(const ProsodicFeatures& features) const {
  FeatureVector x = FeatureVector::Constant(0.5f);

  // Silent windows stay at the feature midpoint and fall back to the bias (neutral)
  if (features.energy_mean >= config_.silence_rms) {
    x(0) = clamp(features.energy_mean / 0.25f, 0.0f, 1.0f);
    x(1) = clamp(features.energy_std / (features.energy_mean + 1e-6f), 0.0f, 1.0f);
    if (features.pitch_mean > 0.0f) {
      x(2) = clamp((features.pitch_mean - 80.0f) / 320.0f, 0.0f, 1.0f);
      x(3) = clamp(features.pitch_std / 80.0f, 0.0f, 1.0f);
    } else {
      x(3) = 0.0f;
    }
    x(4) = clamp(features.spectral_centroid / 4000.0f, 0.0f, 1.0f);
    x(5) = clamp(features.zero_crossing_rate / 0.3f, 0.0f, 1.0f);
  }

  LogitVector logits = weights() * (x.array() - 0.5f).matrix() + bias();

  EmotionScores scores;
  for (size_t i = 0; i < kEmotionCount; ++i) {
    scores[i] = logits(static_cast<int>(i));
  }
  softmax(scores.data(), scores.size());
  return scores;
}

EmotionScores ProsodicClassifier::classify(const float* samples, size_t size,
                                           int sample_rate) const {
  return score(extract(samples, size, sample_rate));
}

}  // namespace emotrace
