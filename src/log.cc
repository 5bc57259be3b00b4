#include "log.hh"

#include <cerrno>
#include <cstdio>

namespace edsign {

std::vector<Logger> loggers = {DefaultLogger};

static int indent = 0;

void LOG_Indent(int n) { indent += n; }

void LOG_Unindent(int n) { indent -= n; }

LogEntry::LogEntry(LogLevel log_level, const std::source_location location)
    : log_level(log_level), location(location), buffer(), errsv(errno) {
  buffer.append(indent, ' ');
}

LogEntry::~LogEntry() {
  for (auto &logger : loggers) {
    logger(*this);
  }
}

void DefaultLogger(const LogEntry &e) {
  if (e.log_level == LogLevel::Error) {
    printf("Error: %s\n", e.buffer.c_str());
  } else {
    printf("%s\n", e.buffer.c_str());
  }
  fflush(stdout);
}

const LogEntry &operator<<(const LogEntry &logger, StrView s) {
  logger.buffer += s;
  return logger;
}

const LogEntry &operator<<(const LogEntry &logger, const Status &status) {
  logger.buffer += status.ToStr();
  logger.errsv = status.errsv;
  return logger;
}

} // namespace edsign
