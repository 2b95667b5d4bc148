#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <utility>

#include <ripple/core/disposable.hpp>

namespace ripple {

class scheduler;

namespace detail {

inline const scheduler*& current_context() noexcept {
  thread_local const scheduler* current = nullptr;
  return current;
}

// Marks the calling thread as running inside `s` for the lifetime of the scope.
class context_scope {
public:
  explicit context_scope(const scheduler* s) noexcept : prev_(current_context()) {
    current_context() = s;
  }
  ~context_scope() { current_context() = prev_; }

  context_scope(const context_scope&) = delete;
  context_scope& operator=(const context_scope&) = delete;

private:
  const scheduler* prev_;
};

} // namespace detail

// Abstract execution context.
class scheduler {
public:
  explicit scheduler(std::string name) : name_(std::move(name)) {}
  virtual ~scheduler() = default;

  scheduler(const scheduler&) = delete;
  scheduler& operator=(const scheduler&) = delete;

  const std::string& name() const noexcept { return name_; }

  // Runs `action` on this context. Disposing the returned handle before the action
  // starts cancels it; dropping the handle does not.
  disposable schedule(std::function<void()> action) {
    auto alive = std::make_shared<std::atomic<bool>>(true);
    post([alive, action = std::move(action)]{
      if (!alive->load(std::memory_order_acquire)) return;
      action();
    });
    return disposable([alive]{ alive->store(false, std::memory_order_release); }, false);
  }

  // True while the calling thread runs a task owned by this scheduler.
  bool is_current() const noexcept { return detail::current_context() == this; }

protected:
  virtual void post(std::function<void()> f) = 0;

private:
  std::string name_;
};

// Name of the scheduler whose task is running on this thread, empty outside any.
inline std::string current_scheduler_name() {
  const scheduler* s = detail::current_context();
  return s ? s->name() : std::string{};
}

// Non-owning handle for a scheduler whose lifetime is managed by the caller.
inline std::shared_ptr<scheduler> borrow(scheduler& s) {
  return std::shared_ptr<scheduler>(&s, [](scheduler*) {});
}

// Synchronous: runs on the calling context (good for tests).
class immediate_scheduler final : public scheduler {
public:
  explicit immediate_scheduler(std::string name = "immediate") : scheduler(std::move(name)) {}

protected:
  void post(std::function<void()> f) override { f(); }
};

// The designated serial context, usually owned by the UI thread.
// No thread of its own: the owner runs queued work with drain() or run().
class main_scheduler final : public scheduler {
public:
  explicit main_scheduler(std::string name = "main") : scheduler(std::move(name)) {}

  // Process-wide instance, created on first use.
  static std::shared_ptr<main_scheduler> instance() {
    static const std::shared_ptr<main_scheduler> inst = std::make_shared<main_scheduler>();
    return inst;
  }

  // Runs queued work (including work queued meanwhile) on the calling thread.
  // Returns the number of tasks executed.
  std::size_t drain() {
    detail::context_scope scope(this);
    std::size_t n = 0;
    for (;;) {
      std::function<void()> f;
      {
        std::lock_guard<std::mutex> lock(m_);
        if (q_.empty()) break;
        f = std::move(q_.front()); q_.pop();
      }
      f();
      ++n;
    }
    return n;
  }

  // Blocks the calling thread serving the queue until stop(); queued work is finished first.
  // stop() is sticky: a later run() only drains what is queued.
  void run() {
    detail::context_scope scope(this);
    std::unique_lock<std::mutex> lock(m_);
    for (;;) {
      cv_.wait(lock, [this]{ return stopped_ || !q_.empty(); });
      if (q_.empty()) return;
      auto f = std::move(q_.front()); q_.pop();
      lock.unlock();
      f();
      lock.lock();
      if (stopped_ && q_.empty()) return;
    }
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(m_);
      stopped_ = true;
    }
    cv_.notify_all();
  }

  std::size_t pending() const {
    std::lock_guard<std::mutex> lock(m_);
    return q_.size();
  }

protected:
  void post(std::function<void()> f) override {
    {
      std::lock_guard<std::mutex> lock(m_);
      q_.push(std::move(f));
    }
    cv_.notify_one();
  }

private:
  mutable std::mutex m_;
  std::condition_variable cv_;
  std::queue<std::function<void()>> q_;
  bool stopped_{false};
};

} // namespace ripple
