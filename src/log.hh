#pragma once

// Functions for logging human-readable messages.
//
// Usage:
//
//   LOG << "regular message";
//   ERROR << "error message";
//
// Logging can also accept other types, as long as they can be converted with
// `ToStr`. A `Status` can be logged directly.
//
// Logged messages can have multiple lines - the extra lines are not indented or
// treated in any special way.
//
// There is no need to add a new line character at the end of the logged message
// - it's added there automatically.

#include <functional>
#include <source_location>
#include <vector>

#include "status.hh"
#include "str.hh"

namespace edsign {

enum class LogLevel { Info, Error };

// Appends the logged message when destroyed.
struct LogEntry {
  LogLevel log_level;
  std::source_location location;
  mutable Str buffer;
  mutable int errsv; // saved errno (if any)

  LogEntry(LogLevel, const std::source_location location = std::source_location::current());
  ~LogEntry();
};

using Logger = std::function<void(const LogEntry &)>;

// Prints to stdout. Error entries get an "Error: " prefix.
void DefaultLogger(const LogEntry &e);

// Every logged entry is passed to all of those loggers. Initially contains only
// the DefaultLogger.
extern std::vector<Logger> loggers;

#define LOG edsign::LogEntry(edsign::LogLevel::Info, std::source_location::current())
#define ERROR edsign::LogEntry(edsign::LogLevel::Error, std::source_location::current())

const LogEntry &operator<<(const LogEntry &, StrView);
const LogEntry &operator<<(const LogEntry &, const Status &status);

const LogEntry &operator<<(const LogEntry &logger, const Stringer auto &t) {
  return logger << ToStr(t);
}

void LOG_Indent(int n = 2);

void LOG_Unindent(int n = 2);

} // namespace edsign
