#pragma once
#include <ripple/core/observable.hpp>
#include <ripple/core/scheduler.hpp>
#include <ripple/core/disposable.hpp>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace ripple {

namespace detail {

// Queues events and drains them on the target scheduler. At most one drain task is
// in flight per subscription, so order holds and deliveries never overlap even on
// a concurrent scheduler.
template <class T>
class observe_on_relay final : public observer<T>,
                               public std::enable_shared_from_this<observe_on_relay<T>> {
public:
  observe_on_relay(std::shared_ptr<scheduler> sched, observer_ptr<T> downstream)
    : sched_(std::move(sched)), downstream_(std::move(downstream)) {}

  void on(const event<T>& e) override {
    std::shared_ptr<scheduler> sched;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!alive_) return;
      queue_.push_back(e);
      if (draining_) return;
      draining_ = true;
      sched = sched_;
    }
    // The drain task holds the relay only: the scheduler is never owned by its own work.
    auto self = this->shared_from_this();
    sched->schedule([self]{ self->drain(); });
  }

  // Drops queued events and the relay's reference to the scheduler.
  void cancel() {
    std::shared_ptr<scheduler> sched;
    {
      std::lock_guard<std::mutex> lock(m_);
      alive_ = false;
      queue_.clear();
      sched = std::move(sched_);
    }
    // released outside the lock: a last reference joins workers that may be draining
  }

private:
  void drain() {
    for (;;) {
      std::optional<event<T>> next;
      {
        std::lock_guard<std::mutex> lock(m_);
        if (!alive_ || queue_.empty()) {
          draining_ = false;
          return;
        }
        next.emplace(std::move(queue_.front()));
        queue_.pop_front();
      }
      downstream_->on(*next);
    }
  }

  std::shared_ptr<scheduler> sched_;
  observer_ptr<T> downstream_;

  std::mutex m_;
  std::deque<event<T>> queue_;
  bool draining_{false};
  bool alive_{true};
};

} // namespace detail

// ----------------------------
// observe_on(scheduler)
// Every event reaches the subscriber on `sched`, in the order it was produced.
// ----------------------------
struct op_observe_on {
  std::shared_ptr<scheduler> sched;

  template <class T>
  observable<T> operator()(const observable<T>& src) const {
    return observable<T>::create([src, sched = sched](observer_ptr<T> downstream) {
      auto relay = std::make_shared<detail::observe_on_relay<T>>(sched, std::move(downstream));
      auto up = std::make_shared<disposable>(src.subscribe(relay));
      return disposable([relay, up]{
        relay->cancel();
        up->dispose();
      });
    });
  }
};

// Keeps the scheduler alive for as long as the pipeline exists.
inline auto observe_on(std::shared_ptr<scheduler> sched) { return op_observe_on{ std::move(sched) }; }

// IMPORTANT: sched must outlive the subscription!
inline auto observe_on(scheduler& sched) { return op_observe_on{ borrow(sched) }; }

} // namespace ripple
