#pragma once

/// @file time_format.h
/// @brief Display formatting for timestamps.

#include <string>

namespace emotrace {

/// @brief Formats seconds as zero-padded "MM:SS".
/// @details Seconds are truncated, not rounded. Minutes grow past two digits for long inputs.
/// @param seconds Non-negative time in seconds
/// @return Formatted string (e.g., 75.4 -> "01:15")
std::string format_timestamp(float seconds);

}  // namespace emotrace
