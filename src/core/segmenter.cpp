#include "core/segmenter.h"

#include <algorithm>
#include <cmath>
#include <string>

#include "util/exception.h"

namespace emotrace {

namespace {

size_t to_samples(float seconds, int sample_rate) {
  return static_cast<size_t>(std::llround(static_cast<double>(seconds) * sample_rate));
}

Window make_window(const AudioBuffer& buffer, size_t start, size_t end) {
  const double sr = static_cast<double>(buffer.sample_rate());
  Window w;
  w.start_sample = start;
  w.end_sample = end;
  w.start_seconds = static_cast<float>(start / sr);
  w.end_seconds = static_cast<float>(end / sr);
  w.audio = buffer.slice_samples(start, end);
  return w;
}

}  // namespace

Segmenter::Segmenter(const SegmenterConfig& config) : config_(config) {}

std::vector<Window> Segmenter::segment(const AudioBuffer& buffer) const {
  const float window_sec = config_.window_sec;
  const float overlap_sec = config_.overlap_sec;

  if (!(overlap_sec > 0.0f)) {
    throw InvalidWindowConfigError("overlap must be positive (overlap=" +
                                   std::to_string(overlap_sec) + "s)");
  }
  if (!(overlap_sec < window_sec)) {
    throw InvalidWindowConfigError("overlap must be shorter than window (overlap=" +
                                   std::to_string(overlap_sec) +
                                   "s, window=" + std::to_string(window_sec) + "s)");
  }
  if (!(config_.min_tail_fraction > 0.0f && config_.min_tail_fraction <= 1.0f)) {
    throw InvalidWindowConfigError("min_tail_fraction must be in (0, 1] (min_tail_fraction=" +
                                   std::to_string(config_.min_tail_fraction) + ")");
  }
  if (buffer.sample_rate() <= 0) {
    throw InvalidWindowConfigError("buffer has no sample rate");
  }

  const int sr = buffer.sample_rate();
  const size_t n = buffer.size();
  const size_t window = to_samples(window_sec, sr);
  const size_t overlap = to_samples(overlap_sec, sr);

  if (window > n) {
    throw InvalidWindowConfigError("window exceeds audio duration (window=" +
                                   std::to_string(window_sec) +
                                   "s, duration=" + std::to_string(buffer.duration()) + "s)");
  }
  if (overlap == 0 || overlap >= window) {
    throw InvalidWindowConfigError("window step rounds to an invalid sample count (window=" +
                                   std::to_string(window) + ", overlap=" +
                                   std::to_string(overlap) + " samples)");
  }

  const size_t step = window - overlap;
  const size_t min_tail = std::max<size_t>(
      1, static_cast<size_t>(std::ceil(static_cast<double>(window) * config_.min_tail_fraction)));

  std::vector<Window> windows;
  windows.reserve((n - window) / step + 2);

  size_t start = 0;
  for (size_t k = 0;; ++k) {
    start = k * step;
    if (start + window > n) break;
    windows.push_back(make_window(buffer, start, start + window));
  }

  // Tail: audio past the last full window, cut from the next step position
  const size_t last_end = windows.back().end_sample;
  if (last_end < n && n - start >= min_tail) {
    windows.push_back(make_window(buffer, start, n));
  }

  return windows;
}

std::vector<Window> segment(const AudioBuffer& buffer, float window_sec, float overlap_sec) {
  SegmenterConfig config;
  config.window_sec = window_sec;
  config.overlap_sec = overlap_sec;
  return Segmenter(config).segment(buffer);
}

}  // namespace emotrace
