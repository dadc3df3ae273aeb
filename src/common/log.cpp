#include "common/log.h"

#include <cstdlib>
#include <iostream>

namespace rfpos {
namespace {

std::string to_upper(std::string s) {
  for (char& c : s) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
  }
  return s;
}

LogLevel level_from_env() {
  const char* level = std::getenv("RFPOS_LOG_LEVEL");
  if (!level || !*level) return LogLevel::INFO;
  return ParseLogLevel(level);
}

} // namespace

LogLevel ParseLogLevel(const std::string& text) {
  const std::string v = to_upper(text);
  if (v == "TRACE") return LogLevel::TRACE;
  if (v == "DEBUG") return LogLevel::DEBUG;
  if (v == "INFO")  return LogLevel::INFO;
  if (v == "WARN" || v == "WARNING") return LogLevel::WARN;
  if (v == "ERROR") return LogLevel::ERROR;
  return LogLevel::INFO;
}

LogLevel CurrentLogLevel() {
  static const LogLevel level = level_from_env();
  return level;
}

bool ShouldLog(LogLevel level) {
  return static_cast<int>(level) >= static_cast<int>(CurrentLogLevel());
}

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::TRACE: return "TRACE";
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARNING";
    case LogLevel::ERROR: return "ERROR";
  }
  return "INFO";
}

void Log(LogLevel level, const std::string& msg) {
  if (!ShouldLog(level)) return;
  std::cerr << LogLevelName(level) << ": " << msg << "\n";
}

} // namespace rfpos
