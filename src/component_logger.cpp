#include "component_logger.h"

#include <cstring>

namespace relay {

LogSink* ComponentLogger::sink_ = nullptr;

void ComponentLogger::init(LogSink* sink) {
  sink_ = sink;
}

bool ComponentLogger::enabled(Severity s) const {
  return sink_ && log_sink_accepts(*sink_, s);
}

void ComponentLogger::log_valist(Severity severity, const char* fmt, va_list args) const {
  if (!enabled(severity)) return;

  LogRecord r{};
  r.severity = severity;
  std::strncpy(r.component, name_, sizeof(r.component) - 1);
  std::vsnprintf(r.text, sizeof(r.text), fmt, args);
  log_sink_write(*sink_, r);
}

void ComponentLogger::trace(const char* fmt, ...) const {
  va_list args;
  va_start(args, fmt);
  log_valist(Severity::Trace, fmt, args);
  va_end(args);
}

void ComponentLogger::debug(const char* fmt, ...) const {
  va_list args;
  va_start(args, fmt);
  log_valist(Severity::Debug, fmt, args);
  va_end(args);
}

void ComponentLogger::info(const char* fmt, ...) const {
  va_list args;
  va_start(args, fmt);
  log_valist(Severity::Info, fmt, args);
  va_end(args);
}

void ComponentLogger::warn(const char* fmt, ...) const {
  va_list args;
  va_start(args, fmt);
  log_valist(Severity::Warn, fmt, args);
  va_end(args);
}

void ComponentLogger::error(const char* fmt, ...) const {
  va_list args;
  va_start(args, fmt);
  log_valist(Severity::Error, fmt, args);
  va_end(args);
}

}  // namespace relay
