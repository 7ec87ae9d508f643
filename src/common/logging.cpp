#include "logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>

namespace chatrelay {

bool parse_log_level(const std::string &s, LogLevel &out) {
  std::string v(s);
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char ch) { return (char)std::tolower(ch); });
  if (v == "trace")
    out = LogLevel::TRACE;
  else if (v == "debug")
    out = LogLevel::DEBUG;
  else if (v == "info")
    out = LogLevel::INFO;
  else if (v == "warn" || v == "warning")
    out = LogLevel::WARN;
  else if (v == "error")
    out = LogLevel::ERROR;
  else if (v == "off")
    out = LogLevel::OFF;
  else
    return false;
  return true;
}

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}

void Logger::set_level(LogLevel lvl) { level_.store(lvl); }

void Logger::set_sink(std::FILE *sink) {
  std::lock_guard<std::mutex> lk(mtx_);
  sink_ = sink;
}

const char *Logger::level_str(LogLevel lvl) {
  switch (lvl) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  default:
    return "ERROR";
  }
}

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (lvl == LogLevel::OFF || lvl < level_.load())
    return;
  using namespace std::chrono;
  auto t = system_clock::to_time_t(system_clock::now());
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);

  std::lock_guard<std::mutex> lk(mtx_);
  std::FILE *out = sink_ ? sink_ : stderr;
  std::fprintf(out, "%s [%s] ", ts, level_str(lvl));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(out, fmt, ap);
  va_end(ap);
  std::fprintf(out, "\n");
  std::fflush(out);
}

} // namespace chatrelay
