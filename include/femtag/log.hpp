#pragma once

#include <atomic>
#include <cstdint>
#include <format>
#include <iostream>
#include <mutex>
#include <string_view>
#include <utility>

namespace femtag::log {

enum class Level : std::uint8_t {
  Debug,
  Info,
  Warning,
  Error,
  Off,
};

namespace detail {

inline std::mutex& sink_mutex() {
  static std::mutex m;
  return m;
}

inline std::atomic<Level>& threshold() {
  static std::atomic<Level> level{Level::Info};
  return level;
}

inline void print(Level level, std::string_view msg) {
  if (level < threshold().load(std::memory_order_relaxed)) {
    return;
  }
  const char* label = "[INFO] ";
  switch (level) {
    case Level::Debug:   label = "[DBG]  "; break;
    case Level::Info:    label = "[INFO] "; break;
    case Level::Warning: label = "[WARN] "; break;
    case Level::Error:   label = "[ERR]  "; break;
    case Level::Off:     return;
  }
  std::lock_guard lock(sink_mutex());
  std::clog << label << "femtag: " << msg << '\n';
}

} // namespace detail

inline void set_level(Level level) {
  detail::threshold().store(level, std::memory_order_relaxed);
}

inline Level level() {
  return detail::threshold().load(std::memory_order_relaxed);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
  detail::print(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
  detail::print(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
  detail::print(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

// Compiled out in release builds.
template <typename... Args>
void debug([[maybe_unused]] std::format_string<Args...> fmt, [[maybe_unused]] Args&&... args) {
#ifndef NDEBUG
  detail::print(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#endif
}

} // namespace femtag::log
