/// @file time_format.cpp
/// @brief Implementation of timestamp formatting.

#include "util/time_format.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace emotrace {

std::string format_timestamp(float seconds) {
  long total = static_cast<long>(std::floor(std::max(0.0f, seconds)));
  long mins = total / 60;
  long secs = total % 60;

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02ld:%02ld", mins, secs);
  return buf;
}

}  // namespace emotrace
