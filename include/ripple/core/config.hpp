#pragma once
#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <string_view>
#include <utility>

#include <ripple/core/log.hpp>
#include <ripple/core/scheduler.hpp>

// Fail fast on protocol violations unless built for production.
#ifndef RIPPLE_DEFAULT_FAIL_FAST
#  ifdef NDEBUG
#    define RIPPLE_DEFAULT_FAIL_FAST 0
#  else
#    define RIPPLE_DEFAULT_FAIL_FAST 1
#  endif
#endif

namespace ripple {

// What happens when an event breaks the observer grammar or reaches a binder as an error.
enum class violation_policy {
  fail_fast,      // log at critical level, then std::terminate()
  log_and_ignore  // log at error level, drop the event
};

namespace detail {

struct runtime_config {
  std::atomic<violation_policy> policy{
    RIPPLE_DEFAULT_FAIL_FAST ? violation_policy::fail_fast : violation_policy::log_and_ignore};
  std::mutex m;
  std::shared_ptr<scheduler> main;
};

inline runtime_config& config() {
  static runtime_config cfg;
  return cfg;
}

} // namespace detail

inline void set_violation_policy(violation_policy p) noexcept {
  detail::config().policy.store(p, std::memory_order_relaxed);
}

inline violation_policy get_violation_policy() noexcept {
  return detail::config().policy.load(std::memory_order_relaxed);
}

// Scheduler used by binders and control properties when none is given.
// Defaults to main_scheduler::instance().
inline std::shared_ptr<scheduler> default_main_scheduler() {
  auto& cfg = detail::config();
  std::lock_guard<std::mutex> lock(cfg.m);
  if (cfg.main) return cfg.main;
  return main_scheduler::instance();
}

// Pass nullptr to restore main_scheduler::instance().
inline void set_default_main_scheduler(std::shared_ptr<scheduler> s) {
  auto& cfg = detail::config();
  std::lock_guard<std::mutex> lock(cfg.m);
  cfg.main = std::move(s);
}

namespace detail {

// Returns only under violation_policy::log_and_ignore.
inline void violation(std::string_view what) {
  if (get_violation_policy() == violation_policy::fail_fast) {
    log(log_level::critical, "{}", what);
    std::terminate();
  }
  log(log_level::warn, "{} (ignored)", what);
}

} // namespace detail

} // namespace ripple
