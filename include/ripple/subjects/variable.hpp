#pragma once
#include <utility>

#include <ripple/core/observable.hpp>
#include <ripple/subjects/behavior_subject.hpp>

namespace ripple {

// Value holder observed through a behavior_subject.
// Destruction does not complete observers: the owner calls close() at its end of life.
template <class T>
class variable {
public:
  explicit variable(T initial) : subject_(std::move(initial)) {}

  T value() const { return subject_.value(); }
  void set(const T& v) { subject_.on_next(v); }

  observable<T> as_observable() const { return subject_.as_observable(); }

  void close() { subject_.on_completed(); }
  bool is_closed() const { return subject_.is_closed(); }

private:
  behavior_subject<T> subject_;
};

} // namespace ripple
