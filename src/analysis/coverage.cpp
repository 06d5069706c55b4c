#include "analysis/coverage.h"

#include <algorithm>
#include <numeric>

namespace emotrace {

namespace {

/// @brief Returns the common sample rate of all windows, or 0 if they disagree or lack one.
int common_sample_rate(const std::vector<TimelineEntry>& timeline) {
  int sr = timeline.empty() ? 0 : timeline.front().window.audio.sample_rate();
  for (const auto& entry : timeline) {
    if (entry.window.audio.sample_rate() != sr) return 0;
  }
  return sr;
}

}  // namespace

std::vector<double> coverage_weights(const std::vector<TimelineEntry>& timeline) {
  const size_t n = timeline.size();
  std::vector<double> weights(n, 0.0);

  // Sample indices when available; windows built by hand only carry seconds
  const int sr = common_sample_rate(timeline);
  const double scale = sr > 0 ? 1.0 / sr : 1.0;
  auto start_of = [&](size_t i) {
    const Window& w = timeline[i].window;
    return sr > 0 ? static_cast<double>(w.start_sample) : static_cast<double>(w.start_seconds);
  };
  auto end_of = [&](size_t i) {
    const Window& w = timeline[i].window;
    return sr > 0 ? static_cast<double>(w.end_sample) : static_cast<double>(w.end_seconds);
  };

  for (size_t i = 0; i < n; ++i) {
    double lo = start_of(i);
    double hi = end_of(i);
    if (i > 0) {
      lo = std::max(lo, (start_of(i) + end_of(i - 1)) / 2.0);
    }
    if (i + 1 < n) {
      hi = std::min(hi, (start_of(i + 1) + end_of(i)) / 2.0);
    }
    if (!timeline[i].classified || hi <= lo) continue;
    weights[i] = (hi - lo) * scale;
  }
  return weights;
}

double total_coverage(const std::vector<double>& weights) {
  return std::accumulate(weights.begin(), weights.end(), 0.0);
}

}  // namespace emotrace
