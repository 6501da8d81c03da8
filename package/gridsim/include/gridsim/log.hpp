#pragma once

#include <cstdio>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace gridsim {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_log_level(LogLevel level);
LogLevel log_level();

namespace detail {

void write_log_line(LogLevel level, const std::string &msg);

template <typename... Args>
void log_at(LogLevel level, fmt::format_string<Args...> f, Args &&...args) {
  if (static_cast<int>(level) < static_cast<int>(log_level()))
    return;
  write_log_line(level, fmt::format(f, std::forward<Args>(args)...));
}

} // namespace detail

template <typename... Args>
void log_debug(fmt::format_string<Args...> f, Args &&...args) {
  detail::log_at(LogLevel::Debug, f, std::forward<Args>(args)...);
}

template <typename... Args>
void log_info(fmt::format_string<Args...> f, Args &&...args) {
  detail::log_at(LogLevel::Info, f, std::forward<Args>(args)...);
}

template <typename... Args>
void log_warn(fmt::format_string<Args...> f, Args &&...args) {
  detail::log_at(LogLevel::Warn, f, std::forward<Args>(args)...);
}

template <typename... Args>
void log_error(fmt::format_string<Args...> f, Args &&...args) {
  detail::log_at(LogLevel::Error, f, std::forward<Args>(args)...);
}

} // namespace gridsim
