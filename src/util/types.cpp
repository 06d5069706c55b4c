/// @file types.cpp
/// @brief Label parsing for common types.

#include "util/types.h"

namespace emotrace {

bool parse_emotion(const std::string& name, Emotion& out) {
  for (Emotion e : kAllEmotions) {
    if (name == emotion_name(e)) {
      out = e;
      return true;
    }
  }
  return false;
}

}  // namespace emotrace
