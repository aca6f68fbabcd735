#pragma once
#include <cstdint>
#include <string>

namespace ospawn::core {

enum class LogLevel : std::uint8_t {
  Error = 0,
  Warn = 1,
  Info = 2,
  Debug = 3
};

using LogSink = void(*)(LogLevel, const std::string&);

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Accepts "error", "warn"/"warning", "info", "debug" (case-insensitive).
bool parseLogLevel(const std::string& text, LogLevel* level);

// nullptr restores the default stderr sink.
void setLogSink(LogSink sink);
LogSink getLogSink();

bool shouldLog(LogLevel level);
void log(LogLevel level, const std::string& msg);
void log(LogLevel level, const char* msg);

const char* logLevelToString(LogLevel level);

// Installs a sink (and optionally a level) for the lifetime of the object.
class ScopedLogSink {
public:
  explicit ScopedLogSink(LogSink sink);
  ScopedLogSink(LogSink sink, LogLevel level);
  ~ScopedLogSink();

  ScopedLogSink(const ScopedLogSink&) = delete;
  ScopedLogSink& operator=(const ScopedLogSink&) = delete;

private:
  LogSink previous_sink_;
  LogLevel previous_level_;
};

}  // namespace ospawn::core
