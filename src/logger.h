#pragma once
// logger.h — Process-wide asynchronous log sink.
//
// Components never print directly; they hand fixed-size LogRecords to the
// sink (see component_logger.h) and a dedicated thread writes them out.

#include <cstdint>
#include <cstdio>
#include <memory>

namespace relay {

enum class Severity : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4 };

struct LogRecord {
  char text[255];
  Severity severity;
  char component[32];
};

const char* severity_name(Severity s);

// Opaque pointer wrapper to prevent dragging `<mutex>` into every component
class LogSink;
void destroy_log_sink(LogSink* sink);

struct LogSinkDeleter {
  void operator()(LogSink* p) const {
    destroy_log_sink(p);
  }
};

using LogSinkPtr = std::unique_ptr<LogSink, LogSinkDeleter>;

// Records below min_severity are dropped before they are queued.
// Lines are written to out as "[SEVERITY][component] text".
LogSinkPtr create_log_sink(Severity min_severity, std::FILE* out = stdout);

bool log_sink_accepts(const LogSink& sink, Severity s);
void log_sink_write(LogSink& sink, const LogRecord& record);

}  // namespace relay
