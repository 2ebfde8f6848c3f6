#include "io/json_writer.h"

#include <cmath>
#include <cstdio>

#include "util/exception.h"

namespace notechart {

namespace {

constexpr int kSignificantDigits = 9;

void append_quoted(std::string& out, const std::string& text) {
  out += '"';
  for (char c : text) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char escaped[8];
          std::snprintf(escaped, sizeof(escaped), "\\u%04x", static_cast<unsigned char>(c));
          out += escaped;
        } else {
          out += c;
        }
    }
  }
  out += '"';
}

}  // namespace

void JsonWriter::begin_item() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (!scopes_.empty()) {
    if (scopes_.back().has_items) out_ += ", ";
    scopes_.back().has_items = true;
  }
}

void JsonWriter::open(char opener, char closer) {
  begin_item();
  out_ += opener;
  scopes_.push_back({closer, false});
}

JsonWriter& JsonWriter::object() {
  open('{', '}');
  return *this;
}

JsonWriter& JsonWriter::array() {
  open('[', ']');
  return *this;
}

JsonWriter& JsonWriter::close() {
  NOTECHART_CHECK_MSG(!scopes_.empty(), ErrorCode::InvalidParameter, "No open JSON scope");
  out_ += scopes_.back().closer;
  scopes_.pop_back();
  after_key_ = false;
  return *this;
}

JsonWriter& JsonWriter::key(const std::string& name) {
  begin_item();
  append_quoted(out_, name);
  out_ += ": ";
  after_key_ = true;
  return *this;
}

JsonWriter& JsonWriter::value(const std::string& text) {
  begin_item();
  append_quoted(out_, text);
  return *this;
}

JsonWriter& JsonWriter::value(const char* text) { return value(std::string(text)); }

JsonWriter& JsonWriter::value(bool flag) {
  begin_item();
  out_ += flag ? "true" : "false";
  return *this;
}

JsonWriter& JsonWriter::value(int number) {
  begin_item();
  out_ += std::to_string(number);
  return *this;
}

JsonWriter& JsonWriter::value(size_t number) {
  begin_item();
  out_ += std::to_string(number);
  return *this;
}

JsonWriter& JsonWriter::value(double number) {
  begin_item();
  if (!std::isfinite(number)) {
    out_ += "null";
    return *this;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.*g", kSignificantDigits, number);
  out_ += buf;
  return *this;
}

JsonWriter& JsonWriter::numbers(const std::vector<float>& values) {
  array();
  for (float v : values) value(static_cast<double>(v));
  return close();
}

}  // namespace notechart
