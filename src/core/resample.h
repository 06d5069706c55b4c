#pragma once

/// @file resample.h
/// @brief Sample rate conversion using r8brain.

#include <vector>

namespace emotrace {

/// @brief Converts mono samples between sample rates.
/// @details Output length is round(size * target_sr / src_sr). Equal rates return a copy.
/// @param samples Input samples
/// @param src_sr Source sample rate in Hz
/// @param target_sr Target sample rate in Hz
/// @return Resampled samples
/// @throws EmotraceException if either rate is not positive
std::vector<float> resample(const std::vector<float>& samples, int src_sr, int target_sr);

}  // namespace emotrace
