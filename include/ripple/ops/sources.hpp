#pragma once
#include <ripple/core/observable.hpp>
#include <ripple/core/disposable.hpp>
#include <exception>
#include <utility>
#include <vector>

namespace ripple {

// Emits the values in order, then completes. Synchronous.
template <class T, class... Rest>
inline observable<T> just(T first, Rest... rest) {
  std::vector<T> values{std::move(first), T(std::move(rest))...};
  return observable<T>::create([values](observer_ptr<T> o) {
    for (const auto& v : values) o->on_next(v);
    o->on_completed();
    return disposable{};
  });
}

template <class T>
inline observable<T> empty() {
  return observable<T>::create([](observer_ptr<T> o) {
    o->on_completed();
    return disposable{};
  });
}

// Never emits anything, never terminates.
template <class T>
inline observable<T> never() {
  return observable<T>::create([](observer_ptr<T>) { return disposable{}; });
}

template <class T>
inline observable<T> error(std::exception_ptr e) {
  return observable<T>::create([e](observer_ptr<T> o) {
    o->on_error(e);
    return disposable{};
  });
}

} // namespace ripple
