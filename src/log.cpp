// SPDX-License-Identifier: MIT

#include "rqh/log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace rqh {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Warn)};
std::mutex g_mtx;

const char* level_name(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Error: return "error";
    case LogLevel::Warn: return "warn";
    case LogLevel::Info: return "info";
    case LogLevel::Debug: return "debug";
  }
  return "?";
}
} // namespace

void set_log_level(LogLevel lvl) { g_level.store(static_cast<int>(lvl)); }
LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

void log_line(LogLevel lvl, const std::string& msg) {
  std::lock_guard<std::mutex> lk(g_mtx);
  std::cerr << "[rqh] " << level_name(lvl) << ": " << msg << "\n";
}

} // namespace rqh
