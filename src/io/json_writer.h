#pragma once

/// @file json_writer.h
/// @brief Incremental JSON text writer for chart and report output.

#include <cstddef>
#include <string>
#include <vector>

namespace notechart {

/// @brief Writes compact JSON text one token at a time.
/// @details Separators are ", " between items and ": " after keys. Numbers use
/// 9 significant digits; NaN and infinity are written as null.
///
/// @code
/// JsonWriter json;
/// json.object().field("bpm", 120.0).key("notes").array().close().close();
/// json.str();  // {"bpm": 120, "notes": []}
/// @endcode
class JsonWriter {
 public:
  /// @brief Opens an object.
  JsonWriter& object();

  /// @brief Opens an array.
  JsonWriter& array();

  /// @brief Closes the innermost open object or array.
  /// @throws NotechartException if nothing is open
  JsonWriter& close();

  /// @brief Writes an object key; the next value belongs to it.
  JsonWriter& key(const std::string& name);

  JsonWriter& value(const std::string& text);
  JsonWriter& value(const char* text);
  JsonWriter& value(bool flag);
  JsonWriter& value(int number);
  JsonWriter& value(size_t number);
  JsonWriter& value(double number);

  /// @brief Writes key(name) followed by value(v).
  template <typename T>
  JsonWriter& field(const std::string& name, const T& v) {
    key(name);
    return value(v);
  }

  /// @brief Writes an array of numbers.
  JsonWriter& numbers(const std::vector<float>& values);

  /// @brief Returns the text written so far.
  const std::string& str() const { return out_; }

 private:
  struct Scope {
    char closer;
    bool has_items;
  };

  void begin_item();
  void open(char opener, char closer);

  std::string out_;
  std::vector<Scope> scopes_;
  bool after_key_ = false;
};

}  // namespace notechart
