#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>
#include <vector>

namespace tradelane::core {

// Streaming JSON writer for tool output.
//
// Call sequence mirrors the document: beginObject(), key("a"), value(1), ...
// The writer inserts commas and (optionally) indentation. It does not check
// that keys are only emitted inside objects.
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& out, bool pretty = true, int indentSpaces = 2);

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  void key(std::string_view k);

  void value(std::string_view s);
  void value(const char* s) { value(std::string_view(s ? s : "")); }
  void value(bool b);
  void value(int v) { value(static_cast<long long>(v)); }
  void value(long long v);
  void value(unsigned long long v);
  void value(double v);
  void nullValue();

  // True once every opened scope has been closed.
  bool complete() const { return stack_.empty() && wroteRoot_; }

private:
  struct Scope {
    bool isObject{false};
    bool empty{true};
  };

  void beforeValue();
  void newline();
  void writeEscaped(std::string_view s);

  std::ostream& out_;
  bool pretty_{true};
  int indent_{2};
  bool pendingKey_{false};
  bool wroteRoot_{false};
  std::vector<Scope> stack_;
};

} // namespace tradelane::core
