#pragma once

/// @file json_writer.h
/// @brief Fluent JSON writer with deterministic number formatting.

#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

namespace emotrace {

/// @brief Fluent JSON writer.
/// @details Floating-point values are written in fixed notation with an explicit precision,
/// so equal inputs always serialize to identical bytes. Non-finite numbers become null.
class JsonWriter {
 public:
  /// @brief Constructs a writer.
  /// @param indent Spaces per nesting level (0 = single line)
  explicit JsonWriter(int indent = 0) : indent_(indent) {}

  JsonWriter& begin_object();
  JsonWriter& end_object();
  JsonWriter& begin_array();
  JsonWriter& end_array();

  /// @brief Writes an object key; the next value call supplies its value.
  JsonWriter& key(const std::string& k);

  JsonWriter& value(const std::string& v);
  JsonWriter& value(const char* v) { return value(std::string(v)); }
  JsonWriter& value(int v);
  JsonWriter& value(size_t v);
  JsonWriter& value(bool v);

  /// @brief Writes a number with a fixed number of decimals.
  /// @param v Value
  /// @param precision Digits after the decimal point
  JsonWriter& value(double v, int precision = 6);

  JsonWriter& null_value();

  // Convenience: key-value pairs
  JsonWriter& kv(const std::string& k, const std::string& v) { return key(k).value(v); }
  JsonWriter& kv(const std::string& k, const char* v) { return key(k).value(v); }
  JsonWriter& kv(const std::string& k, int v) { return key(k).value(v); }
  JsonWriter& kv(const std::string& k, size_t v) { return key(k).value(v); }
  JsonWriter& kv(const std::string& k, bool v) { return key(k).value(v); }
  JsonWriter& kv(const std::string& k, double v, int precision = 6) {
    return key(k).value(v, precision);
  }

  /// @brief Returns the JSON text written so far.
  std::string str() const { return ss_.str(); }

 private:
  void begin_value();
  void end_value();
  void separator();
  void newline();

  static std::string escape(const std::string& s);

  std::ostringstream ss_;
  std::vector<bool> needs_comma_;
  bool after_key_ = false;
  int indent_;
};

}  // namespace emotrace
