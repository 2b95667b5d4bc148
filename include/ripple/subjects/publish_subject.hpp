#pragma once
#include <memory>
#include <vector>

#include <ripple/subjects/fanout.hpp>

namespace ripple {

namespace detail {

template <class T>
class publish_state final : public subject_state<T> {
public:
  void on(const event<T>& e) override {
    std::vector<observer_ptr<T>> targets;
    {
      typename subject_state<T>::lock_type lock(this->m_);
      if (this->terminal_) return;
      targets = e.is_terminal() ? this->close_locked(e) : this->snapshot_locked();
    }
    this->deliver(targets, e);
  }

protected:
  void replay_locked(observer<T>&) override {}
};

} // namespace detail

// publish_subject<T>: hot source without memory.
// Subscribers see only what is emitted after they joined. Thread-safe bookkeeping;
// emission from several producers at once must be serialized by the caller.
template <class T>
class publish_subject : public detail::subject_handle<T, detail::publish_state<T>> {
  using base = detail::subject_handle<T, detail::publish_state<T>>;

public:
  publish_subject() : base(std::make_shared<detail::publish_state<T>>()) {}
};

} // namespace ripple
