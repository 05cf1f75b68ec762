#pragma once

#include <cstdarg>
#include <cstdio>

#include "logger.h"

namespace relay {

// Per-component printf-style front end for the process-wide LogSink.
// Logging is a no-op until init() installs a sink.
class ComponentLogger {
 public:
  explicit ComponentLogger(const char* name) : name_(name) {
  }

  static void init(LogSink* sink);

  bool enabled(Severity s) const;

  void trace(const char* fmt, ...) const __attribute__((format(printf, 2, 3)));
  void debug(const char* fmt, ...) const __attribute__((format(printf, 2, 3)));
  void info(const char* fmt, ...) const __attribute__((format(printf, 2, 3)));
  void warn(const char* fmt, ...) const __attribute__((format(printf, 2, 3)));
  void error(const char* fmt, ...) const __attribute__((format(printf, 2, 3)));

 private:
  static LogSink* sink_;
  const char* name_;

  void log_valist(Severity severity, const char* fmt, va_list args) const;
};

}  // namespace relay
