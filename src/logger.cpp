// logger.cpp

#include "logger.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>

namespace relay {

const char* severity_name(Severity s) {
  switch (s) {
    case Severity::Trace:
      return "TRACE";
    case Severity::Debug:
      return "DEBUG";
    case Severity::Info:
      return "INFO";
    case Severity::Warn:
      return "WARN";
    case Severity::Error:
      return "ERROR";
  }
  return "?";
}

class LogSink {
 public:
  LogSink(Severity min_severity, std::FILE* out) : min_severity_(min_severity), out_(out) {
    thread_ = std::thread([this] { write_loop(); });
  }

  ~LogSink() {
    {
      std::lock_guard lk(mu_);
      running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
  }

  LogSink(const LogSink&) = delete;
  LogSink& operator=(const LogSink&) = delete;

  bool accepts(Severity s) const {
    return s >= min_severity_;
  }

  void push(const LogRecord& r) {
    {
      std::lock_guard lk(mu_);
      queue_.push(r);
    }
    cv_.notify_one();
  }

 private:
  const Severity min_severity_;
  std::FILE* const out_;
  std::queue<LogRecord> queue_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool running_{true};
  std::thread thread_;

  // Drains whatever is queued before exiting so shutdown messages are not lost.
  void write_loop() {
    std::unique_lock lk(mu_);
    while (true) {
      cv_.wait(lk, [this] { return !queue_.empty() || !running_; });
      while (!queue_.empty()) {
        auto r = queue_.front();
        queue_.pop();
        lk.unlock();

        r.text[sizeof(r.text) - 1] = '\0';
        r.component[sizeof(r.component) - 1] = '\0';
        std::fprintf(out_, "[%s][%s] %s\n", severity_name(r.severity), r.component, r.text);
        std::fflush(out_);

        lk.lock();
      }
      if (!running_) break;
    }
  }
};

LogSinkPtr create_log_sink(Severity min_severity, std::FILE* out) {
  return LogSinkPtr(new LogSink(min_severity, out));
}

void destroy_log_sink(LogSink* sink) {
  delete sink;
}

bool log_sink_accepts(const LogSink& sink, Severity s) {
  return sink.accepts(s);
}

void log_sink_write(LogSink& sink, const LogRecord& record) {
  sink.push(record);
}

}  // namespace relay
