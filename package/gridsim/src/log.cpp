#include "gridsim/log.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace gridsim {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_write_mutex;

const char *prefix(LogLevel level) {
  switch (level) {
  case LogLevel::Debug: return "[Debug]";
  case LogLevel::Info: return "[Info]";
  case LogLevel::Warn: return "[Warn]";
  case LogLevel::Error: return "[Error]";
  default: return "";
  }
}
} // namespace

void set_log_level(LogLevel level) { g_level = static_cast<int>(level); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

namespace detail {

void write_log_line(LogLevel level, const std::string &msg) {
  std::lock_guard<std::mutex> lock(g_write_mutex);
  fmt::print(stderr, "{} {}\n", prefix(level), msg);
}

} // namespace detail

} // namespace gridsim
