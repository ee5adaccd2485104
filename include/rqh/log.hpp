// SPDX-License-Identifier: MIT

#pragma once
#include <sstream>
#include <string>

namespace rqh {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

void set_log_level(LogLevel lvl);
LogLevel log_level();
void log_line(LogLevel lvl, const std::string& msg);

// Collects one line and emits it on destruction if lvl passes the filter.
// Filtered streams skip formatting.
class LogStream {
  LogLevel lvl_;
  bool enabled_;
  std::ostringstream os_;

public:
  explicit LogStream(LogLevel lvl) : lvl_(lvl), enabled_(log_level() >= lvl) {}
  LogStream(const LogStream&) = delete;
  LogStream& operator=(const LogStream&) = delete;
  ~LogStream() { if (enabled_) log_line(lvl_, os_.str()); }

  template <typename T>
  LogStream& operator<<(const T& v) {
    if (enabled_) os_ << v;
    return *this;
  }
};

// logger(LogLevel::Info) << "shots=" << n;
inline LogStream logger(LogLevel lvl) { return LogStream(lvl); }

} // namespace rqh
