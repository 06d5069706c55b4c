#include "core/resample.h"

#include <algorithm>
#include <cmath>

#include "CDSPResampler.h"
#include "util/exception.h"

namespace emotrace {

namespace {

constexpr int kBlockSize = 1024;

/// @brief Upper bound on zero blocks fed to drain the filter delay line.
constexpr int kMaxFlushBlocks = 16;

}  // namespace

std::vector<float> resample(const std::vector<float>& samples, int src_sr, int target_sr) {
  EMOTRACE_CHECK_MSG(src_sr > 0 && target_sr > 0, ErrorCode::InvalidParameter,
                     "Sample rates must be positive: " + std::to_string(src_sr) + " -> " +
                         std::to_string(target_sr));

  if (samples.empty() || src_sr == target_sr) {
    return samples;
  }

  const double ratio = static_cast<double>(target_sr) / static_cast<double>(src_sr);
  const size_t expected = static_cast<size_t>(std::llround(samples.size() * ratio));

  r8b::CDSPResampler24 resampler(static_cast<double>(src_sr), static_cast<double>(target_sr),
                                 kBlockSize);

  std::vector<float> output;
  output.reserve(expected);
  std::vector<double> block(kBlockSize);

  auto feed = [&](int len) {
    double* out_ptr = nullptr;
    int out_len = resampler.process(block.data(), len, out_ptr);
    for (int i = 0; i < out_len && output.size() < expected; ++i) {
      output.push_back(static_cast<float>(out_ptr[i]));
    }
  };

  for (size_t pos = 0; pos < samples.size(); pos += kBlockSize) {
    int len = static_cast<int>(std::min(samples.size() - pos, static_cast<size_t>(kBlockSize)));
    std::copy(samples.begin() + pos, samples.begin() + pos + len, block.begin());
    feed(len);
  }

  // Drain the filter delay with silence
  std::fill(block.begin(), block.end(), 0.0);
  for (int i = 0; i < kMaxFlushBlocks && output.size() < expected; ++i) {
    feed(kBlockSize);
  }

  output.resize(expected, 0.0f);
  return output;
}

}  // namespace emotrace
