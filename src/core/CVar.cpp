#include "tradelane/core/CVar.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace tradelane::core {

static std::string_view trimView(std::string_view s) {
  std::size_t b = 0;
  while (b < s.size() && std::isspace((unsigned char)s[b])) ++b;
  std::size_t e = s.size();
  while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
  return s.substr(b, e - b);
}

static std::string lowerAscii(std::string_view s) {
  std::string out(s.size(), '\0');
  for (std::size_t i = 0; i < s.size(); ++i) {
    out[i] = (char)std::tolower((unsigned char)s[i]);
  }
  return out;
}

static bool parseBool(std::string_view s, bool& out) {
  const std::string k = lowerAscii(trimView(s));
  if (k == "1" || k == "true" || k == "on" || k == "yes") { out = true; return true; }
  if (k == "0" || k == "false" || k == "off" || k == "no") { out = false; return true; }
  return false;
}

static bool parseInt(std::string_view s, std::int64_t& out) {
  s = trimView(s);
  if (s.empty()) return false;

  std::int64_t v = 0;
  const auto* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, 10);
  if (res.ec != std::errc{} || res.ptr != end) return false;
  out = v;
  return true;
}

static bool parseFloat(std::string_view s, double& out) {
  s = trimView(s);
  if (s.empty()) return false;

  // strtod needs a terminated buffer.
  const std::string tmp(s);
  char* end = nullptr;
  const double v = std::strtod(tmp.c_str(), &end);
  if (!end || (std::size_t)(end - tmp.c_str()) != tmp.size()) return false;
  out = v;
  return true;
}

static std::string unquote(std::string_view s) {
  s = trimView(s);
  if (s.size() >= 2) {
    const char q0 = s.front();
    const char q1 = s.back();
    if ((q0 == '"' && q1 == '"') || (q0 == '\'' && q1 == '\'')) {
      s = s.substr(1, s.size() - 2);
    }
  }
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '\\' && i + 1 < s.size()) {
      const char n = s[i + 1];
      if (n == '\\' || n == '"' || n == '\'') { out.push_back(n); ++i; continue; }
    }
    out.push_back(c);
  }
  return out;
}

static std::string quote(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '\\' || c == '"') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

// Cut a trailing "# comment" that is not inside quotes.
static std::string_view stripComment(std::string_view sv) {
  bool inQuote = false;
  for (std::size_t i = 0; i < sv.size(); ++i) {
    const char c = sv[i];
    if (c == '"') inQuote = !inQuote;
    if (!inQuote && c == '#') return trimView(sv.substr(0, i));
  }
  return sv;
}

static bool holdsType(const CVarValue& v, CVarType t) {
  switch (t) {
    case CVarType::Bool:   return std::holds_alternative<bool>(v);
    case CVarType::Int:    return std::holds_alternative<std::int64_t>(v);
    case CVarType::Float:  return std::holds_alternative<double>(v);
    case CVarType::String: return std::holds_alternative<std::string>(v);
  }
  return false;
}

bool CVarRegistry::exists(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return vars_.find(name) != vars_.end();
}

bool CVarRegistry::defineImpl(std::string_view name, CVarType type, CVarValue def, std::string_view help) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = vars_.find(name);
  if (it != vars_.end()) {
    if (it->second.type != type) return false;
    if (!help.empty()) it->second.help = std::string(help);
    it->second.defaultValue = std::move(def);
    return true;
  }

  CVar v;
  v.name = std::string(name);
  v.help = std::string(help);
  v.type = type;
  v.value = def;
  v.defaultValue = std::move(def);
  vars_.emplace(v.name, std::move(v));
  return true;
}

bool CVarRegistry::defineBool(std::string_view name, bool defaultValue, std::string_view help) {
  return defineImpl(name, CVarType::Bool, CVarValue{defaultValue}, help);
}

bool CVarRegistry::defineInt(std::string_view name, std::int64_t defaultValue, std::string_view help) {
  return defineImpl(name, CVarType::Int, CVarValue{defaultValue}, help);
}

bool CVarRegistry::defineFloat(std::string_view name, double defaultValue, std::string_view help) {
  return defineImpl(name, CVarType::Float, CVarValue{defaultValue}, help);
}

bool CVarRegistry::defineString(std::string_view name, std::string defaultValue, std::string_view help) {
  return defineImpl(name, CVarType::String, CVarValue{std::move(defaultValue)}, help);
}

bool CVarRegistry::setValueImpl(std::string_view name, CVarValue v, std::string* outError) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = vars_.find(name);
  if (it == vars_.end()) {
    if (outError) *outError = "Unknown cvar: " + std::string(name);
    return false;
  }
  if (!holdsType(v, it->second.type)) {
    if (outError) *outError = "Type mismatch for cvar: " + it->second.name;
    return false;
  }
  it->second.value = std::move(v);
  return true;
}

bool CVarRegistry::setBool(std::string_view name, bool v, std::string* outError) {
  return setValueImpl(name, CVarValue{v}, outError);
}

bool CVarRegistry::setInt(std::string_view name, std::int64_t v, std::string* outError) {
  return setValueImpl(name, CVarValue{v}, outError);
}

bool CVarRegistry::setFloat(std::string_view name, double v, std::string* outError) {
  return setValueImpl(name, CVarValue{v}, outError);
}

bool CVarRegistry::setString(std::string_view name, std::string v, std::string* outError) {
  return setValueImpl(name, CVarValue{std::move(v)}, outError);
}

bool CVarRegistry::setFromString(std::string_view name, std::string_view value, std::string* outError) {
  CVarType type;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vars_.find(name);
    if (it == vars_.end()) {
      if (outError) *outError = "Unknown cvar: " + std::string(name);
      return false;
    }
    type = it->second.type;
  }

  switch (type) {
    case CVarType::Bool: {
      bool b = false;
      if (!parseBool(value, b)) {
        if (outError) *outError = "Invalid bool for " + std::string(name) + ": " + std::string(value);
        return false;
      }
      return setBool(name, b, outError);
    }
    case CVarType::Int: {
      std::int64_t i = 0;
      if (!parseInt(value, i)) {
        if (outError) *outError = "Invalid int for " + std::string(name) + ": " + std::string(value);
        return false;
      }
      return setInt(name, i, outError);
    }
    case CVarType::Float: {
      double f = 0.0;
      if (!parseFloat(value, f)) {
        if (outError) *outError = "Invalid float for " + std::string(name) + ": " + std::string(value);
        return false;
      }
      return setFloat(name, f, outError);
    }
    case CVarType::String:
      return setString(name, unquote(value), outError);
  }
  if (outError) *outError = "Unknown cvar type.";
  return false;
}

bool CVarRegistry::reset(std::string_view name, std::string* outError) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = vars_.find(name);
  if (it == vars_.end()) {
    if (outError) *outError = "Unknown cvar: " + std::string(name);
    return false;
  }
  it->second.value = it->second.defaultValue;
  return true;
}

bool CVarRegistry::getBool(std::string_view name, bool fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end() || !std::holds_alternative<bool>(it->second.value)) return fallback;
  return std::get<bool>(it->second.value);
}

std::int64_t CVarRegistry::getInt(std::string_view name, std::int64_t fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end() || !std::holds_alternative<std::int64_t>(it->second.value)) return fallback;
  return std::get<std::int64_t>(it->second.value);
}

double CVarRegistry::getFloat(std::string_view name, double fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end() || !std::holds_alternative<double>(it->second.value)) return fallback;
  return std::get<double>(it->second.value);
}

std::string CVarRegistry::getString(std::string_view name, std::string_view fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end() || !std::holds_alternative<std::string>(it->second.value)) return std::string(fallback);
  return std::get<std::string>(it->second.value);
}

std::vector<CVar> CVarRegistry::list(std::string_view filter) const {
  const std::string needle = lowerAscii(filter);
  std::vector<CVar> out;
  std::lock_guard<std::mutex> lock(mutex_);
  out.reserve(vars_.size());
  for (const auto& kv : vars_) {
    if (!needle.empty() && lowerAscii(kv.first).find(needle) == std::string::npos) continue;
    out.push_back(kv.second);
  }
  return out;
}

const char* CVarRegistry::typeName(CVarType t) {
  switch (t) {
    case CVarType::Bool: return "bool";
    case CVarType::Int: return "int";
    case CVarType::Float: return "float";
    case CVarType::String: return "string";
  }
  return "?";
}

std::string CVarRegistry::valueToString(const CVar& v) {
  switch (v.type) {
    case CVarType::Bool:
      return std::get<bool>(v.value) ? "true" : "false";
    case CVarType::Int:
      return std::to_string(std::get<std::int64_t>(v.value));
    case CVarType::Float: {
      std::ostringstream oss;
      oss << std::get<double>(v.value);
      return oss.str();
    }
    case CVarType::String:
      return std::get<std::string>(v.value);
  }
  return {};
}

bool CVarRegistry::loadFile(const std::string& path, std::string* outError) {
  std::ifstream in(path);
  if (!in) {
    if (outError) *outError = "Failed to open config file: " + path;
    return false;
  }

  bool hadErrors = false;
  std::ostringstream errs;

  std::string line;
  int lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;

    std::string_view sv = trimView(line);
    if (sv.empty() || sv.front() == '#') continue;
    sv = stripComment(sv);
    if (sv.empty()) continue;

    std::string_view name;
    std::string_view val;

    const std::size_t eq = sv.find('=');
    if (eq != std::string_view::npos) {
      name = trimView(sv.substr(0, eq));
      val = trimView(sv.substr(eq + 1));
    } else {
      std::size_t sp = 0;
      while (sp < sv.size() && !std::isspace((unsigned char)sv[sp])) ++sp;
      name = sv.substr(0, sp);
      val = trimView(sv.substr(sp));
    }

    if (name.empty()) {
      hadErrors = true;
      errs << path << ":" << lineNo << ": missing name\n";
      continue;
    }

    std::string err;
    if (!setFromString(name, val, &err)) {
      hadErrors = true;
      errs << path << ":" << lineNo << ": " << err << "\n";
    }
  }

  if (hadErrors && outError) *outError = errs.str();
  return !hadErrors;
}

bool CVarRegistry::saveFile(const std::string& path, std::string* outError) const {
  std::ofstream out(path);
  if (!out) {
    if (outError) *outError = "Failed to write config file: " + path;
    return false;
  }

  out << "# tradelane options\n\n";

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& kv : vars_) {
    const CVar& v = kv.second;
    if (!v.help.empty()) out << "# " << v.help << "\n";
    out << v.name << " = ";
    if (v.type == CVarType::String) {
      out << quote(std::get<std::string>(v.value));
    } else {
      out << valueToString(v);
    }
    out << "\n";
  }

  if (!out) {
    if (outError) *outError = "Failed to write config file: " + path;
    return false;
  }
  return true;
}

} // namespace tradelane::core
