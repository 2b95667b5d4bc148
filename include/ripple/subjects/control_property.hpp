#pragma once
#include <memory>
#include <utility>

#include <ripple/core/binder.hpp>
#include <ripple/core/config.hpp>
#include <ripple/core/observable.hpp>
#include <ripple/subjects/behavior_subject.hpp>

namespace ripple {

// A value that is both observed and written, like a UI control's property.
// Writes always land through a binder on the property's scheduler; it never fails.
// Composition of behavior_subject and binder.
template <class T>
class control_property {
public:
  explicit control_property(T initial, std::shared_ptr<scheduler> sched = default_main_scheduler())
    : values_(std::move(initial)) {
    behavior_subject<T> values = values_;
    writer_ = make_binder<T>([values](const T& v) { values.on_next(v); }, std::move(sched));
  }

  // Current value followed by every change.
  observable<T> changes() const { return values_.as_observable(); }

  // Write side: errors are rejected by the binder, completion ignored.
  observer_ptr<T> as_observer() const { return writer_; }

  void set(const T& v) const { writer_->on_next(v); }

  T value() const { return values_.value(); }

  // Drive the property from a source for as long as the returned handle lives.
  disposable bind(const observable<T>& src) const { return src.subscribe(as_observer()); }

  // End of life of the control: completes its observers on the property's scheduler.
  // Completion follows pending set() writes only on a serial scheduler (main, serial,
  // immediate); on a concurrent_scheduler it may overtake them.
  void close() const {
    behavior_subject<T> values = values_;
    writer_->target_scheduler()->schedule([values]{ values.on_completed(); });
  }

private:
  behavior_subject<T> values_;
  std::shared_ptr<binder<T>> writer_;
};

} // namespace ripple
