#pragma once
#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

#include <ripple/subjects/fanout.hpp>

namespace ripple {

namespace detail {

template <class T>
class replay_state final : public subject_state<T> {
public:
  // nullopt capacity keeps everything.
  explicit replay_state(std::optional<std::size_t> capacity) : capacity_(capacity) {}

  void on(const event<T>& e) override {
    std::vector<observer_ptr<T>> targets;
    {
      typename subject_state<T>::lock_type lock(this->m_);
      if (this->terminal_) return;
      if (e.is_next()) {
        buffer_.push_back(e.value());
        if (capacity_ && buffer_.size() > *capacity_) buffer_.pop_front();
        targets = this->snapshot_locked();
      } else {
        targets = this->close_locked(e);
      }
    }
    this->deliver(targets, e);
  }

  std::size_t buffered() const {
    typename subject_state<T>::lock_type lock(this->m_);
    return buffer_.size();
  }

protected:
  void replay_locked(observer<T>& obs) override {
    for (const auto& v : buffer_) obs.on(event<T>::next(v));
  }

private:
  std::optional<std::size_t> capacity_;
  std::deque<T> buffer_;
};

} // namespace detail

// replay_subject<T>: remembers the last N values (or all of them) and replays them,
// in emission order, to every new subscriber before live delivery. After termination
// a newcomer still gets the buffer, followed by the terminal event.
// Emission from several producers at once must be serialized by the caller.
template <class T>
class replay_subject : public detail::subject_handle<T, detail::replay_state<T>> {
  using base = detail::subject_handle<T, detail::replay_state<T>>;

public:
  static replay_subject create(std::size_t buffer_size) {
    if (buffer_size == 0) throw std::invalid_argument("replay_subject: buffer_size must be positive");
    return replay_subject(buffer_size);
  }

  static replay_subject create_unbounded() {
    return replay_subject(std::nullopt);
  }

  std::size_t buffered() const { return this->st_->buffered(); }

private:
  explicit replay_subject(std::optional<std::size_t> capacity)
    : base(std::make_shared<detail::replay_state<T>>(capacity)) {}
};

} // namespace ripple
