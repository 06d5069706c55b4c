#pragma once

/// @file coverage.h
/// @brief Non-overlapping coverage weights for timeline entries.

#include <vector>

#include "analysis/timeline_builder.h"

namespace emotrace {

/// @brief Returns the duration each entry owns once overlaps are split at their midpoint.
/// @details Entry i owns [max(start_i, (start_i + end_{i-1}) / 2),
/// min(end_i, (start_{i+1} + end_i) / 2)). Boundaries are computed in samples when every
/// window shares a sample rate, so the weights of a gap-free timeline sum to the covered
/// span exactly. Gap entries keep their share of the partition but get weight 0.
/// @param timeline Entries ordered by start time
/// @return Weight in seconds for each entry
std::vector<double> coverage_weights(const std::vector<TimelineEntry>& timeline);

/// @brief Returns the sum of coverage weights.
double total_coverage(const std::vector<double>& weights);

}  // namespace emotrace
