#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tradelane::core {

// Typed configuration variables ("CVars").
//
// A registry is an ordinary value owned by whoever needs it; there is no
// process-wide instance. Iteration order is name-sorted so listings and saved
// files are stable.

enum class CVarType : std::uint8_t {
  Bool   = 0,
  Int    = 1,
  Float  = 2,
  String = 3
};

using CVarValue = std::variant<bool, std::int64_t, double, std::string>;

struct CVar {
  std::string name;
  std::string help;
  CVarType type{CVarType::String};

  CVarValue value{};
  CVarValue defaultValue{};
};

class CVarRegistry {
public:
  CVarRegistry() = default;

  CVarRegistry(const CVarRegistry&) = delete;
  CVarRegistry& operator=(const CVarRegistry&) = delete;

  bool exists(std::string_view name) const;

  // Idempotent when the type matches; returns false on a type clash.
  bool defineBool(std::string_view name, bool defaultValue, std::string_view help = {});
  bool defineInt(std::string_view name, std::int64_t defaultValue, std::string_view help = {});
  bool defineFloat(std::string_view name, double defaultValue, std::string_view help = {});
  bool defineString(std::string_view name, std::string defaultValue, std::string_view help = {});

  bool        getBool(std::string_view name, bool fallback = false) const;
  std::int64_t getInt(std::string_view name, std::int64_t fallback = 0) const;
  double      getFloat(std::string_view name, double fallback = 0.0) const;
  std::string getString(std::string_view name, std::string_view fallback = {}) const;

  bool setBool(std::string_view name, bool v, std::string* outError = nullptr);
  bool setInt(std::string_view name, std::int64_t v, std::string* outError = nullptr);
  bool setFloat(std::string_view name, double v, std::string* outError = nullptr);
  bool setString(std::string_view name, std::string v, std::string* outError = nullptr);

  // Parses `value` according to the variable's declared type.
  bool setFromString(std::string_view name, std::string_view value, std::string* outError = nullptr);

  bool reset(std::string_view name, std::string* outError = nullptr);

  // Snapshot copies in name order. A non-empty `filter` keeps names containing
  // it (case-insensitive).
  std::vector<CVar> list(std::string_view filter = {}) const;

  static const char* typeName(CVarType t);
  static std::string valueToString(const CVar& v);

  // File format:
  //   # comment
  //   commodity_route_default_count = 3
  //   log_level = "debug"      # trailing comment
  //
  // Every line is applied; unknown names and unparsable values are collected
  // as "path:line: message" and make the call return false.
  bool loadFile(const std::string& path, std::string* outError = nullptr);
  bool saveFile(const std::string& path, std::string* outError = nullptr) const;

private:
  bool defineImpl(std::string_view name, CVarType type, CVarValue def, std::string_view help);
  bool setValueImpl(std::string_view name, CVarValue v, std::string* outError);

  mutable std::mutex mutex_;
  std::map<std::string, CVar, std::less<>> vars_;
};

} // namespace tradelane::core
