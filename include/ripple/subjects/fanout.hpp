#pragma once
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include <ripple/core/disposable.hpp>
#include <ripple/core/event.hpp>
#include <ripple/core/observable.hpp>
#include <ripple/core/observer.hpp>

namespace ripple {
namespace detail {

// State shared by every subject variant: the registry of live observers keyed for
// removal, the recorded terminal event, and the lock guarding both.
// Variants add their buffer and decide what a newcomer is replayed.
//
// Live fan-out is delivered outside of the lock; replay to a newcomer happens under
// it so no event slips between replay and registration. The mutex is recursive
// because a replayed observer may emit back into the subject.
template <class T>
class subject_state : public observer<T>,
                      public std::enable_shared_from_this<subject_state<T>> {
public:
  disposable subscribe(observer_ptr<T> obs) {
    std::lock_guard<std::recursive_mutex> lock(m_);
    replay_locked(*obs);
    if (terminal_) {
      obs->on(*terminal_);
      return disposable{};
    }
    const std::uint64_t key = next_key_++;
    slots_.push_back({key, std::move(obs)});

    std::weak_ptr<subject_state> weak = this->shared_from_this();
    return disposable([weak, key]{
      if (auto self = weak.lock()) self->remove(key);
    });
  }

  bool has_observers() const {
    std::lock_guard<std::recursive_mutex> lock(m_);
    return !slots_.empty();
  }

  bool is_closed() const {
    std::lock_guard<std::recursive_mutex> lock(m_);
    return terminal_.has_value();
  }

protected:
  using lock_type = std::lock_guard<std::recursive_mutex>;

  // History a newcomer receives before the recorded terminal event or live delivery.
  virtual void replay_locked(observer<T>& obs) = 0;

  std::vector<observer_ptr<T>> snapshot_locked() const {
    std::vector<observer_ptr<T>> out;
    out.reserve(slots_.size());
    for (const auto& s : slots_) out.push_back(s.obs);
    return out;
  }

  // Records the terminal event and hands back the observers that still have to see it.
  std::vector<observer_ptr<T>> close_locked(const event<T>& terminal) {
    terminal_ = terminal;
    std::vector<observer_ptr<T>> out;
    out.reserve(slots_.size());
    for (auto& s : slots_) out.push_back(std::move(s.obs));
    slots_.clear();
    return out;
  }

  static void deliver(const std::vector<observer_ptr<T>>& targets, const event<T>& e) {
    for (const auto& o : targets) o->on(e);
  }

  mutable std::recursive_mutex m_;
  std::optional<event<T>> terminal_;

private:
  void remove(std::uint64_t key) {
    observer_ptr<T> dropped;
    std::lock_guard<std::recursive_mutex> lock(m_);
    for (auto it = slots_.begin(); it != slots_.end(); ++it) {
      if (it->key == key) {
        dropped = std::move(it->obs);
        slots_.erase(it);
        break;
      }
    }
  }

  struct slot {
    std::uint64_t key;
    observer_ptr<T> obs;
  };

  std::vector<slot> slots_;
  std::uint64_t next_key_{0};
};

// Copyable handle over a shared subject state: the push API plus both faces,
// as_observable() for subscribers and as_observer() for upstream sources.
template <class T, class State>
class subject_handle {
public:
  observable<T> as_observable() const {
    std::shared_ptr<State> st = st_;
    return observable<T>::create([st](observer_ptr<T> o) { return st->subscribe(std::move(o)); });
  }

  observer_ptr<T> as_observer() const { return st_; }

  void on(const event<T>& e) const        { st_->on(e); }
  void on_next(const T& v) const          { st_->on(event<T>::next(v)); }
  void on_error(std::exception_ptr e) const { st_->on(event<T>::error(std::move(e))); }
  void on_completed() const               { st_->on(event<T>::completed()); }

  bool has_observers() const { return st_->has_observers(); }
  bool is_closed() const     { return st_->is_closed(); }

protected:
  explicit subject_handle(std::shared_ptr<State> st) : st_(std::move(st)) {}

  std::shared_ptr<State> st_;
};

} // namespace detail
} // namespace ripple
