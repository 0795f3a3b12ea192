#pragma once

#include <string>
#include <string_view>

namespace tradelane::core {

enum class LogLevel {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Off   = 5
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

std::string_view toString(LogLevel level);

// Case-insensitive: trace|debug|info|warn|error|off.
bool tryParseLogLevel(std::string_view text, LogLevel& out);

// Optional callback sink for log messages.
//
// Sinks are invoked after the line has been written to stderr. The views are
// only valid for the duration of the callback.
struct LogSink {
  using Fn = void (*)(LogLevel level, std::string_view channel, std::string_view message, void* user);
  Fn fn{nullptr};
  void* user{nullptr};
};

void addLogSink(LogSink sink);
void removeLogSink(LogSink sink);

// When false, only sinks receive messages (tests / embedding hosts).
void setLogToStderr(bool enabled);

// Writes "[hh:mm:ss.mmm][LEVEL][channel] message" to stderr.
void log(LogLevel level, std::string_view channel, std::string_view message);

inline bool logEnabled(LogLevel level) {
  const LogLevel cur = getLogLevel();
  return cur != LogLevel::Off && static_cast<int>(level) >= static_cast<int>(cur);
}

} // namespace tradelane::core

#define TRADELANE_LOG_TRACE(ch, msg) ::tradelane::core::log(::tradelane::core::LogLevel::Trace, (ch), (msg))
#define TRADELANE_LOG_DEBUG(ch, msg) ::tradelane::core::log(::tradelane::core::LogLevel::Debug, (ch), (msg))
#define TRADELANE_LOG_INFO(ch, msg)  ::tradelane::core::log(::tradelane::core::LogLevel::Info,  (ch), (msg))
#define TRADELANE_LOG_WARN(ch, msg)  ::tradelane::core::log(::tradelane::core::LogLevel::Warn,  (ch), (msg))
#define TRADELANE_LOG_ERROR(ch, msg) ::tradelane::core::log(::tradelane::core::LogLevel::Error, (ch), (msg))
