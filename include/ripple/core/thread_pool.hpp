#pragma once
#include <ripple/core/scheduler.hpp>
#include <ripple/core/log.hpp>
#include <condition_variable>
#include <cstddef>
#include <queue>
#include <thread>
#include <vector>
#include <mutex>
#include <functional>
#include <memory>
#include <string>

namespace ripple {

namespace detail {

// Fixed set of worker threads serving one FIFO queue on behalf of `owner`.
// Pending work is finished before the destructor returns.
// Destroyed from one of its own tasks (the last shared_ptr to the owner released on a
// worker), the calling worker is detached instead of joined and still-queued tasks are
// dropped. The queue state is shared with the workers so a detached one exits cleanly.
class worker_pool {
public:
  worker_pool(const scheduler* owner, std::size_t threads)
  : owner_(owner), state_(std::make_shared<state>()) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
      workers_.emplace_back([st = state_, owner]{
        context_scope scope(owner);
        for (;;) {
          std::function<void()> task;
          {
            std::unique_lock<std::mutex> lock(st->m);
            st->cv.wait(lock, [&]{ return st->stop || !st->q.empty(); });
            if (st->stop && st->q.empty()) return;
            task = std::move(st->q.front());
            st->q.pop();
          }
          task();
        }
      });
    }
  }

  ~worker_pool() {
    const auto self = std::this_thread::get_id();
    bool from_worker = false;
    for (auto& t : workers_) if (t.get_id() == self) from_worker = true;

    std::size_t pending = 0;
    std::queue<std::function<void()>> dropped;
    {
      std::lock_guard<std::mutex> lock(state_->m);
      state_->stop = true;
      pending = state_->q.size();
      if (from_worker) dropped.swap(state_->q);
    }
    if (from_worker) {
      log(log_level::warn, "scheduler '{}' destroyed from its own worker, {} pending task(s) dropped",
          owner_->name(), pending);
      // the running task must not see the destroyed scheduler as its context
      current_context() = nullptr;
    } else if (pending != 0) {
      log(log_level::debug, "scheduler '{}' shutting down with {} pending task(s)",
          owner_->name(), pending);
    }
    state_->cv.notify_all();
    for (auto& t : workers_) {
      if (t.get_id() == self) t.detach();
      else if (t.joinable()) t.join();
    }
  }

  void post(std::function<void()> f) {
    {
      std::lock_guard<std::mutex> lock(state_->m);
      state_->q.push(std::move(f));
    }
    state_->cv.notify_one();
  }

  std::size_t size() const noexcept { return workers_.size(); }

  worker_pool(const worker_pool&) = delete;
  worker_pool& operator=(const worker_pool&) = delete;

private:
  struct state {
    std::mutex m;
    std::condition_variable cv;
    std::queue<std::function<void()>> q;
    bool stop{false};
  };

  const scheduler* owner_;
  std::shared_ptr<state> state_;
  std::vector<std::thread> workers_;
};

} // namespace detail

// Serial background context: one dedicated thread, tasks run in submission order.
class serial_scheduler final : public scheduler {
public:
  explicit serial_scheduler(std::string name = "serial")
  : scheduler(std::move(name)), pool_(this, 1) {}

protected:
  void post(std::function<void()> f) override { pool_.post(std::move(f)); }

private:
  detail::worker_pool pool_;
};

// Concurrent background context: at most `max_concurrent` tasks run at once.
class concurrent_scheduler final : public scheduler {
public:
  explicit concurrent_scheduler(std::size_t max_concurrent = std::thread::hardware_concurrency(),
                                std::string name = "concurrent")
  : scheduler(std::move(name)), pool_(this, max_concurrent) {}

  std::size_t max_concurrent() const noexcept { return pool_.size(); }

protected:
  void post(std::function<void()> f) override { pool_.post(std::move(f)); }

private:
  detail::worker_pool pool_;
};

} // namespace ripple
