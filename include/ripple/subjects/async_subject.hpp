#pragma once
#include <memory>
#include <optional>
#include <vector>

#include <ripple/subjects/fanout.hpp>

namespace ripple {

namespace detail {

template <class T>
class async_state final : public subject_state<T> {
public:
  void on(const event<T>& e) override {
    std::vector<observer_ptr<T>> targets;
    std::optional<T> last;
    {
      typename subject_state<T>::lock_type lock(this->m_);
      if (this->terminal_) return;
      switch (e.kind()) {
        case event_kind::next:
          last_ = e.value();
          return;
        case event_kind::error:
          last_.reset();
          break;
        case event_kind::completed:
          last = last_;
          break;
      }
      targets = this->close_locked(e);
    }
    for (const auto& o : targets) {
      if (last) o->on(event<T>::next(*last));
      o->on(e);
    }
  }

protected:
  void replay_locked(observer<T>& obs) override {
    if (this->terminal_ && this->terminal_->is_completed() && last_) obs.on(event<T>::next(*last_));
  }

private:
  std::optional<T> last_;
};

} // namespace detail

// async_subject<T>: emits nothing until completion, then only the last value
// followed by completed, to current and future subscribers alike.
// An error drops the value: everyone receives only the error.
template <class T>
class async_subject : public detail::subject_handle<T, detail::async_state<T>> {
  using base = detail::subject_handle<T, detail::async_state<T>>;

public:
  async_subject() : base(std::make_shared<detail::async_state<T>>()) {}
};

} // namespace ripple
