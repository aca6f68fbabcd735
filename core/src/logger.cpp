#include "ospawn/core/common/logger.hpp"

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>

#ifndef _WIN32
#include <unistd.h>
#include <cstdio>
#endif

namespace ospawn::core {

static std::atomic<LogLevel> g_level{LogLevel::Warn};
static std::atomic<LogSink> g_sink{nullptr};

const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Info: return "INFO";
    case LogLevel::Debug: return "DEBUG";
  }
  return "UNKNOWN";
}

bool parseLogLevel(const std::string& text, LogLevel* level) {
  if (!level) return false;
  std::string lower;
  lower.reserve(text.size());
  for (char c : text) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  if (lower == "error") {
    *level = LogLevel::Error;
  } else if (lower == "warn" || lower == "warning") {
    *level = LogLevel::Warn;
  } else if (lower == "info") {
    *level = LogLevel::Info;
  } else if (lower == "debug") {
    *level = LogLevel::Debug;
  } else {
    return false;
  }
  return true;
}

static bool stderrIsColorTerminal() {
#ifdef _WIN32
  return false;
#else
  // -1: unknown, 0: plain, 1: color
  static std::atomic<int> cached{-1};
  int c = cached.load();
  if (c == -1) {
    c = (std::getenv("NO_COLOR") == nullptr && isatty(fileno(stderr))) ? 1 : 0;
    cached.store(c);
  }
  return c == 1;
#endif
}

static const char* levelColor(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "\x1b[31m";
    case LogLevel::Warn: return "\x1b[33m";
    case LogLevel::Info: return "\x1b[32m";
    case LogLevel::Debug: return "\x1b[90m";
  }
  return "\x1b[0m";
}

static void stderrSink(LogLevel level, const std::string& msg) {
  const bool color = stderrIsColorTerminal();
  if (color) std::cerr << levelColor(level);
  std::cerr << "[ospawn][" << logLevelToString(level) << "] " << msg;
  if (color) std::cerr << "\x1b[0m";
  std::cerr << "\n";
}

void setLogLevel(LogLevel level) {
  g_level.store(level);
}

LogLevel getLogLevel() {
  return g_level.load();
}

void setLogSink(LogSink sink) {
  g_sink.store(sink);
}

LogSink getLogSink() {
  return g_sink.load();
}

bool shouldLog(LogLevel level) {
  return static_cast<int>(level) <= static_cast<int>(g_level.load());
}

void log(LogLevel level, const std::string& msg) {
  if (!shouldLog(level)) return;
  LogSink sink = g_sink.load();
  (sink ? sink : &stderrSink)(level, msg);
}

void log(LogLevel level, const char* msg) {
  log(level, msg ? std::string(msg) : std::string());
}

ScopedLogSink::ScopedLogSink(LogSink sink)
  : previous_sink_(getLogSink()), previous_level_(getLogLevel()) {
  setLogSink(sink);
}

ScopedLogSink::ScopedLogSink(LogSink sink, LogLevel level)
  : ScopedLogSink(sink) {
  setLogLevel(level);
}

ScopedLogSink::~ScopedLogSink() {
  setLogSink(previous_sink_);
  setLogLevel(previous_level_);
}

}  // namespace ospawn::core
