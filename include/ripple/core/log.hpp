#pragma once
#include <atomic>
#include <cstdio>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace ripple {

enum class log_level { trace, debug, info, warn, error, critical, off };

inline const char* to_string(log_level lvl) noexcept {
  switch (lvl) {
    case log_level::trace:    return "trace";
    case log_level::debug:    return "debug";
    case log_level::info:     return "info";
    case log_level::warn:     return "warn";
    case log_level::error:    return "error";
    case log_level::critical: return "critical";
    case log_level::off:      return "off";
  }
  return "?";
}

using log_sink = std::function<void(log_level, std::string_view)>;

namespace detail {

struct log_state {
  std::mutex m;
  log_sink sink;
  std::atomic<log_level> threshold{log_level::info};
};

inline log_state& logger() {
  static log_state st;
  return st;
}

inline void stderr_sink(log_level lvl, std::string_view msg) {
  fmt::print(stderr, "[ripple] {}: {}\n", to_string(lvl), msg);
}

} // namespace detail

inline void set_log_level(log_level lvl) noexcept {
  detail::logger().threshold.store(lvl, std::memory_order_relaxed);
}

inline log_level get_log_level() noexcept {
  return detail::logger().threshold.load(std::memory_order_relaxed);
}

// Replace the process-wide sink. An empty function restores the stderr sink.
inline void set_log_sink(log_sink sink) {
  auto& st = detail::logger();
  std::lock_guard<std::mutex> lock(st.m);
  st.sink = std::move(sink);
}

inline bool should_log(log_level lvl) noexcept {
  return lvl != log_level::off && lvl >= get_log_level();
}

template <class... Args>
void log(log_level lvl, fmt::format_string<Args...> fmt_str, Args&&... args) {
  if (!should_log(lvl)) return;
  const std::string msg = fmt::format(fmt_str, std::forward<Args>(args)...);

  log_sink sink;
  {
    auto& st = detail::logger();
    std::lock_guard<std::mutex> lock(st.m);
    sink = st.sink;
  }
  if (sink) sink(lvl, msg);
  else detail::stderr_sink(lvl, msg);
}

// Human-readable description of an error carried by an event.
inline std::string describe(std::exception_ptr e) {
  if (!e) return "null exception";
  try {
    std::rethrow_exception(e);
  } catch (const std::exception& ex) {
    return ex.what();
  } catch (...) {
    return "non-standard exception";
  }
}

} // namespace ripple
