#pragma once
#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

#include <fmt/format.h>
#include <ripple/core/config.hpp>
#include <ripple/core/disposable.hpp>
#include <ripple/core/event.hpp>
#include <ripple/core/observer.hpp>

namespace ripple {

namespace detail {

// Sits between a producer and one subscriber.
// - Delivery is serialized: events from different threads never overlap.
// - After a terminal event the grammar is enforced through the violation policy.
// - After dispose() nothing reaches the subscriber.
// The mutex is recursive so a subscriber may re-enter its own producer.
template <class T>
class sink final : public observer<T> {
public:
  explicit sink(observer_ptr<T> downstream) : downstream_(std::move(downstream)) {}

  void on(const event<T>& e) override {
    std::lock_guard<std::recursive_mutex> lock(m_);
    if (stopped_) {
      violation(fmt::format("'{}' delivered after a terminal event", to_string(e)));
      return;
    }
    if (disposed_.load(std::memory_order_acquire)) return;
    if (e.is_terminal()) stopped_ = true;
    downstream_->on(e);
    if (stopped_) dispose();
  }

  // Attach the producer's teardown; runs it at once if the subscriber is already gone.
  void set_upstream(disposable up) {
    {
      std::lock_guard<std::mutex> lock(up_m_);
      if (!disposed_.load(std::memory_order_acquire)) {
        upstream_ = std::move(up);
        return;
      }
    }
    up.dispose();
  }

  void dispose() noexcept {
    if (disposed_.exchange(true, std::memory_order_acq_rel)) return;
    disposable up;
    {
      std::lock_guard<std::mutex> lock(up_m_);
      up = std::move(upstream_);
    }
    up.dispose();
  }

private:
  observer_ptr<T> downstream_;
  std::recursive_mutex m_;
  bool stopped_{false};

  std::mutex up_m_;
  disposable upstream_;
  std::atomic<bool> disposed_{false};
};

} // namespace detail

template <class T>
class observable {
public:
  using value_type = T;
  using OnNext = typename any_observer<T>::OnNext;
  using OnErr  = typename any_observer<T>::OnErr;
  using OnDone = typename any_observer<T>::OnDone;
  using subscribe_fn = std::function<disposable(observer_ptr<T>)>;

  // Factory: the function receives the subscriber and returns the teardown of
  // whatever it started for it.
  static observable create(subscribe_fn impl) {
    return observable(std::move(impl));
  }

  disposable subscribe(observer_ptr<T> obs) const {
    auto s = std::make_shared<detail::sink<T>>(std::move(obs));
    s->set_upstream(impl_(s));
    return disposable([s]{ s->dispose(); });
  }

  disposable subscribe(OnNext on_next,
                       OnErr  on_err  = {},
                       OnDone on_done = {}) const {
    return subscribe(make_observer<T>(std::move(on_next), std::move(on_err), std::move(on_done)));
  }

private:
  explicit observable(subscribe_fn impl)
    : impl_(std::move(impl)) {}

  subscribe_fn impl_;
};

} // namespace ripple
