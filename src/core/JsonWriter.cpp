#include "tradelane/core/JsonWriter.h"

#include <cmath>
#include <cstdio>

namespace tradelane::core {

JsonWriter::JsonWriter(std::ostream& out, bool pretty, int indentSpaces)
  : out_(out), pretty_(pretty), indent_(indentSpaces < 0 ? 0 : indentSpaces) {}

void JsonWriter::newline() {
  if (!pretty_) return;
  out_ << '\n';
  for (std::size_t i = 0; i < stack_.size() * (std::size_t)indent_; ++i) out_ << ' ';
}

void JsonWriter::beforeValue() {
  if (pendingKey_) {
    pendingKey_ = false;
    return;
  }
  if (stack_.empty()) {
    wroteRoot_ = true;
    return;
  }
  Scope& s = stack_.back();
  if (!s.empty) out_ << ',';
  s.empty = false;
  newline();
}

void JsonWriter::beginObject() {
  beforeValue();
  out_ << '{';
  stack_.push_back(Scope{true, true});
}

void JsonWriter::endObject() {
  if (stack_.empty()) return;
  const bool wasEmpty = stack_.back().empty;
  stack_.pop_back();
  if (!wasEmpty) newline();
  out_ << '}';
  if (stack_.empty() && pretty_) out_ << '\n';
}

void JsonWriter::beginArray() {
  beforeValue();
  out_ << '[';
  stack_.push_back(Scope{false, true});
}

void JsonWriter::endArray() {
  if (stack_.empty()) return;
  const bool wasEmpty = stack_.back().empty;
  stack_.pop_back();
  if (!wasEmpty) newline();
  out_ << ']';
  if (stack_.empty() && pretty_) out_ << '\n';
}

void JsonWriter::key(std::string_view k) {
  beforeValue();
  writeEscaped(k);
  out_ << (pretty_ ? ": " : ":");
  pendingKey_ = true;
}

void JsonWriter::value(std::string_view s) {
  beforeValue();
  writeEscaped(s);
}

void JsonWriter::value(bool b) {
  beforeValue();
  out_ << (b ? "true" : "false");
}

void JsonWriter::value(long long v) {
  beforeValue();
  out_ << v;
}

void JsonWriter::value(unsigned long long v) {
  beforeValue();
  out_ << v;
}

void JsonWriter::value(double v) {
  beforeValue();
  // JSON has no NaN/Inf.
  if (!std::isfinite(v)) {
    out_ << "null";
    return;
  }
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.15g", v);
  out_ << buf;
}

void JsonWriter::nullValue() {
  beforeValue();
  out_ << "null";
}

void JsonWriter::writeEscaped(std::string_view s) {
  out_ << '"';
  for (const char c : s) {
    switch (c) {
      case '"': out_ << "\\\""; break;
      case '\\': out_ << "\\\\"; break;
      case '\n': out_ << "\\n"; break;
      case '\r': out_ << "\\r"; break;
      case '\t': out_ << "\\t"; break;
      default:
        if ((unsigned char)c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
          out_ << buf;
        } else {
          out_ << c;
        }
        break;
    }
  }
  out_ << '"';
}

} // namespace tradelane::core
