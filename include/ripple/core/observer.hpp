#pragma once
#include <exception>
#include <functional>
#include <memory>
#include <utility>

#include <ripple/core/event.hpp>

namespace ripple {

// A sink of events. A conforming producer stops calling on() after error or completed.
template <class T>
class observer {
public:
  virtual ~observer() = default;

  virtual void on(const event<T>& e) = 0;

  void on_next(const T& v)              { on(event<T>::next(v)); }
  void on_error(std::exception_ptr e)   { on(event<T>::error(std::move(e))); }
  void on_completed()                   { on(event<T>::completed()); }
};

template <class T>
using observer_ptr = std::shared_ptr<observer<T>>;

// Ad hoc observer built from callbacks; missing handlers are no-ops.
template <class T>
class any_observer final : public observer<T> {
public:
  using OnNext  = std::function<void(const T&)>;
  using OnErr   = std::function<void(std::exception_ptr)>;
  using OnDone  = std::function<void()>;
  using OnEvent = std::function<void(const event<T>&)>;

  explicit any_observer(OnNext on_next, OnErr on_err = {}, OnDone on_done = {})
    : on_next_(std::move(on_next)), on_err_(std::move(on_err)), on_done_(std::move(on_done)) {}

  // Single handler receiving every event as is.
  static std::shared_ptr<any_observer> from_events(OnEvent handler) {
    auto o = std::make_shared<any_observer>(OnNext{});
    o->on_event_ = std::move(handler);
    return o;
  }

  void on(const event<T>& e) override {
    if (on_event_) { on_event_(e); return; }
    switch (e.kind()) {
      case event_kind::next:      if (on_next_) on_next_(e.value()); break;
      case event_kind::error:     if (on_err_)  on_err_(e.exception()); break;
      case event_kind::completed: if (on_done_) on_done_(); break;
    }
  }

private:
  OnNext  on_next_;
  OnErr   on_err_;
  OnDone  on_done_;
  OnEvent on_event_;
};

template <class T>
inline observer_ptr<T> make_observer(typename any_observer<T>::OnNext on_next,
                                     typename any_observer<T>::OnErr on_err = {},
                                     typename any_observer<T>::OnDone on_done = {}) {
  return std::make_shared<any_observer<T>>(std::move(on_next), std::move(on_err), std::move(on_done));
}

template <class T>
inline observer_ptr<T> make_event_observer(typename any_observer<T>::OnEvent handler) {
  return any_observer<T>::from_events(std::move(handler));
}

} // namespace ripple
