#pragma once
#include <exception>
#include <memory>
#include <utility>
#include <vector>

#include <ripple/subjects/fanout.hpp>

namespace ripple {

namespace detail {

template <class T>
class behavior_state final : public subject_state<T> {
public:
  explicit behavior_state(T initial) : value_(std::move(initial)) {}

  void on(const event<T>& e) override {
    std::vector<observer_ptr<T>> targets;
    {
      typename subject_state<T>::lock_type lock(this->m_);
      if (this->terminal_) return;
      if (e.is_next()) {
        value_ = e.value();
        targets = this->snapshot_locked();
      } else {
        targets = this->close_locked(e);
      }
    }
    this->deliver(targets, e);
  }

  T value() const {
    typename subject_state<T>::lock_type lock(this->m_);
    if (this->terminal_ && this->terminal_->is_error()) std::rethrow_exception(this->terminal_->exception());
    return value_;
  }

protected:
  void replay_locked(observer<T>& obs) override {
    if (!this->terminal_) obs.on(event<T>::next(value_));
  }

private:
  T value_;
};

} // namespace detail

// behavior_subject<T>: always holds a current value. New subscribers receive it first,
// then live values. Once terminated, newcomers receive only the terminal event.
template <class T>
class behavior_subject : public detail::subject_handle<T, detail::behavior_state<T>> {
  using base = detail::subject_handle<T, detail::behavior_state<T>>;

public:
  explicit behavior_subject(T initial)
    : base(std::make_shared<detail::behavior_state<T>>(std::move(initial))) {}

  // Current value; rethrows the recorded error if the subject failed.
  T value() const { return this->st_->value(); }
};

} // namespace ripple
