#pragma once
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include <fmt/format.h>
#include <ripple/core/config.hpp>
#include <ripple/core/event.hpp>
#include <ripple/core/observer.hpp>
#include <ripple/core/scheduler.hpp>

namespace ripple {

// Observer for UI-facing sinks: acts on next values only, always on its scheduler.
// An error reaching a binder means the upstream was never meant to fail; it goes to
// the violation policy and is never handed to the action. Completion is ignored.
template <class T>
class binder final : public observer<T> {
public:
  using action_fn = std::function<void(const T&)>;

  explicit binder(action_fn action, std::shared_ptr<scheduler> sched = default_main_scheduler())
    : action_(std::move(action)), sched_(std::move(sched)) {}

  // The action runs only while `target` is alive.
  template <class Target>
  binder(std::weak_ptr<Target> target,
         std::function<void(Target&, const T&)> action,
         std::shared_ptr<scheduler> sched = default_main_scheduler())
    : binder([target = std::move(target), action = std::move(action)](const T& v) {
        if (auto t = target.lock()) action(*t, v);
      }, std::move(sched)) {}

  void on(const event<T>& e) override {
    switch (e.kind()) {
      case event_kind::next:
        sched_->schedule([action = action_, v = e.value()]{ action(v); });
        break;
      case event_kind::error:
        detail::violation(fmt::format("binding error on '{}': {}", sched_->name(), describe(e.exception())));
        break;
      case event_kind::completed:
        break;
    }
  }

  const std::shared_ptr<scheduler>& target_scheduler() const noexcept { return sched_; }

private:
  action_fn action_;
  std::shared_ptr<scheduler> sched_;
};

template <class T, class F>
inline std::shared_ptr<binder<T>> make_binder(F&& action,
                                              std::shared_ptr<scheduler> sched = default_main_scheduler()) {
  return std::make_shared<binder<T>>(typename binder<T>::action_fn(std::forward<F>(action)), std::move(sched));
}

template <class T, class Target, class F>
inline std::shared_ptr<binder<T>> make_binder(const std::shared_ptr<Target>& target, F&& action,
                                              std::shared_ptr<scheduler> sched = default_main_scheduler()) {
  return std::make_shared<binder<T>>(std::weak_ptr<Target>(target),
                                     std::function<void(Target&, const T&)>(std::forward<F>(action)),
                                     std::move(sched));
}

} // namespace ripple
