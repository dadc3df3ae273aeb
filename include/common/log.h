#pragma once
/**
 * @file log.h
 * @brief Minimal leveled logging to stderr, level chosen by RFPOS_LOG_LEVEL.
 */

#include <string>

namespace rfpos {

enum class LogLevel : int {
  TRACE = 0,
  DEBUG = 1,
  INFO  = 2,
  WARN  = 3,
  ERROR = 4
};

// Parse a level name (case-insensitive). Unknown or empty text maps to INFO.
LogLevel ParseLogLevel(const std::string& text);

// Level read once from the RFPOS_LOG_LEVEL environment variable.
LogLevel CurrentLogLevel();

bool ShouldLog(LogLevel level);

// Write "<LEVEL>: msg" to stderr when the level is enabled.
void Log(LogLevel level, const std::string& msg);

const char* LogLevelName(LogLevel level);

} // namespace rfpos
