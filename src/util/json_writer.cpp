/// @file json_writer.cpp
/// @brief Implementation of JsonWriter.

#include "util/json_writer.h"

#include <cmath>
#include <cstdio>
#include <iomanip>

namespace emotrace {

JsonWriter& JsonWriter::begin_object() {
  begin_value();
  ss_ << "{";
  needs_comma_.push_back(false);
  return *this;
}

JsonWriter& JsonWriter::end_object() {
  bool had_members = needs_comma_.back();
  needs_comma_.pop_back();
  if (had_members) newline();
  ss_ << "}";
  end_value();
  return *this;
}

JsonWriter& JsonWriter::begin_array() {
  begin_value();
  ss_ << "[";
  needs_comma_.push_back(false);
  return *this;
}

JsonWriter& JsonWriter::end_array() {
  bool had_elements = needs_comma_.back();
  needs_comma_.pop_back();
  if (had_elements) newline();
  ss_ << "]";
  end_value();
  return *this;
}

JsonWriter& JsonWriter::key(const std::string& k) {
  separator();
  ss_ << "\"" << escape(k) << "\": ";
  after_key_ = true;
  return *this;
}

JsonWriter& JsonWriter::value(const std::string& v) {
  begin_value();
  ss_ << "\"" << escape(v) << "\"";
  end_value();
  return *this;
}

JsonWriter& JsonWriter::value(int v) {
  begin_value();
  ss_ << v;
  end_value();
  return *this;
}

JsonWriter& JsonWriter::value(size_t v) {
  begin_value();
  ss_ << v;
  end_value();
  return *this;
}

JsonWriter& JsonWriter::value(bool v) {
  begin_value();
  ss_ << (v ? "true" : "false");
  end_value();
  return *this;
}

JsonWriter& JsonWriter::value(double v, int precision) {
  if (!std::isfinite(v)) {
    return null_value();
  }
  begin_value();
  // Avoid printing "-0.000"
  double rounded = std::round(v * std::pow(10.0, precision)) / std::pow(10.0, precision);
  if (rounded == 0.0) rounded = 0.0;
  ss_ << std::fixed << std::setprecision(precision) << rounded;
  end_value();
  return *this;
}

JsonWriter& JsonWriter::null_value() {
  begin_value();
  ss_ << "null";
  end_value();
  return *this;
}

void JsonWriter::begin_value() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (!needs_comma_.empty()) {
    separator();
  }
}

void JsonWriter::end_value() {
  if (!needs_comma_.empty()) needs_comma_.back() = true;
}

void JsonWriter::separator() {
  if (needs_comma_.empty()) return;
  if (needs_comma_.back()) {
    ss_ << ",";
    if (indent_ == 0) ss_ << " ";
  }
  if (indent_ > 0) newline();
}

void JsonWriter::newline() {
  if (indent_ == 0) return;
  ss_ << "\n" << std::string(needs_comma_.size() * static_cast<size_t>(indent_), ' ');
}

std::string JsonWriter::escape(const std::string& s) {
  std::string result;
  result.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(c));
          result += buf;
        } else {
          result += c;
        }
    }
  }
  return result;
}

}  // namespace emotrace
