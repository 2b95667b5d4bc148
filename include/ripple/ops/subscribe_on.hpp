#pragma once
#include <ripple/core/observable.hpp>
#include <ripple/core/disposable.hpp>
#include <ripple/core/scheduler.hpp>
#include <memory>
#include <mutex>
#include <utility>

namespace ripple {

// ================================
// subscribe_on(scheduler)
// The subscription itself (producer setup and whatever it emits meanwhile) runs on
// `sched`. Later events arrive wherever the producer emits them.
// ================================
struct op_subscribe_on {
  std::shared_ptr<scheduler> sched;

  template <class T>
  observable<T> operator()(const observable<T>& src) const {
    return observable<T>::create([src, sched = sched](observer_ptr<T> downstream) {
      struct state {
        std::mutex m;
        bool alive{true};
        disposable up;
      };
      auto st = std::make_shared<state>();
      auto wst = std::weak_ptr<state>(st);

      // transfer the subscription itself to the specified scheduler
      auto pending = std::make_shared<disposable>(sched->schedule([wst, src, downstream]{
        auto s = wst.lock();
        if (!s) return; // unsubscribed before they had time to subscribe
        {
          std::lock_guard<std::mutex> lock(s->m);
          if (!s->alive) return;
        }
        auto up = src.subscribe(downstream);
        {
          std::lock_guard<std::mutex> lock(s->m);
          if (s->alive) {
            s->up = std::move(up);
            return;
          }
        }
        up.dispose();
      }));

      // unsubscribe: cancel the pending subscribe or tear down the upstream
      return disposable([st, pending]{
        pending->dispose();
        disposable up;
        {
          std::lock_guard<std::mutex> lock(st->m);
          st->alive = false;
          up = std::move(st->up);
        }
        up.dispose();
      });
    });
  }
};

// Keeps the scheduler alive until the subscription ends.
inline auto subscribe_on(std::shared_ptr<scheduler> sched) { return op_subscribe_on{ std::move(sched) }; }

// IMPORTANT: The scheduler must live longer than the subscription!
inline auto subscribe_on(scheduler& sched) { return op_subscribe_on{ borrow(sched) }; }

} // namespace ripple
