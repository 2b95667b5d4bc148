#pragma once
#include <exception>
#include <functional>
#include <utility>

#include <ripple/core/log.hpp>

namespace ripple {

// RAII wrapper around a teardown action.
// - Copying is PROHIBITED (preventing double teardown).
// - Moving is allowed: ownership is moved, the original object is reset.
// - By default, the destructor disposes (can be disabled with a flag).
class disposable {
public:
  using teardown_fn = std::function<void()>;

  // Creates an empty disposable.
  disposable() noexcept = default;

  explicit disposable(teardown_fn fn, bool dispose_on_dtor = true) noexcept
    : teardown_(std::move(fn)), dispose_on_dtor_(dispose_on_dtor) {}

  disposable(const disposable&) = delete;
  disposable& operator=(const disposable&) = delete;

  disposable(disposable&& other) noexcept
    : teardown_(std::move(other.teardown_))
    , dispose_on_dtor_(other.dispose_on_dtor_) {
    other.teardown_ = nullptr;
    other.dispose_on_dtor_ = false;
  }

  disposable& operator=(disposable&& other) noexcept {
    if (this != &other) {
      if (dispose_on_dtor_) dispose();
      teardown_ = std::move(other.teardown_);
      dispose_on_dtor_ = other.dispose_on_dtor_;
      other.teardown_ = nullptr;
      other.dispose_on_dtor_ = false;
    }
    return *this;
  }

  ~disposable() {
    if (dispose_on_dtor_) dispose();
  }

  // Runs the teardown once. Repeated calls are no-op.
  // A throwing teardown is logged, never rethrown: disposal runs from destructors.
  void dispose() noexcept {
    dispose_on_dtor_ = false;
    if (!teardown_) return;
    auto fn = std::move(teardown_);
    teardown_ = nullptr;
    try {
      fn();
    } catch (const std::exception& e) {
      log(log_level::error, "teardown threw: {}", e.what());
    } catch (...) {
      log(log_level::error, "teardown threw a non-standard exception");
    }
  }

  // Forget the teardown without running it.
  // Useful if responsibility for teardown has moved to another object.
  void release() noexcept {
    teardown_ = nullptr;
    dispose_on_dtor_ = false;
  }

  // There is a teardown still pending.
  explicit operator bool() const noexcept { return static_cast<bool>(teardown_); }

  // Set policy: whether to dispose in destructor.
  disposable& dispose_on_destruct(bool v) noexcept {
    dispose_on_dtor_ = v && static_cast<bool>(teardown_);
    return *this;
  }

private:
  teardown_fn teardown_{};
  bool dispose_on_dtor_{false};
};

} // namespace ripple
