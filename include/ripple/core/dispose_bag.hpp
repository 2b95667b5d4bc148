#pragma once
#include <cstddef>
#include <mutex>
#include <vector>

#include <ripple/core/disposable.hpp>
#include <ripple/core/pipeline.hpp>

namespace ripple {

// Owns many disposables and releases them together, on dispose() or destruction.
// Anything added after the bag was disposed is disposed on the spot.
class dispose_bag {
public:
  dispose_bag() = default;

  void add(disposable d) {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!disposed_) {
        items_.push_back(std::move(d));
        return;
      }
    }
    d.dispose();
  }

  void dispose() {
    std::vector<disposable> local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (disposed_) return;
      disposed_ = true;
      local.swap(items_);
    }
    for (auto& d : local) d.dispose();
  }

  bool is_disposed() const {
    std::lock_guard<std::mutex> lock(m_);
    return disposed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(m_);
    return items_.size();
  }

  ~dispose_bag() { dispose(); }

  dispose_bag(const dispose_bag&)            = delete;
  dispose_bag& operator=(const dispose_bag&) = delete;

  dispose_bag(dispose_bag&&)            = delete;
  dispose_bag& operator=(dispose_bag&&) = delete;

private:
  mutable std::mutex m_;
  bool disposed_{false};
  std::vector<disposable> items_;
};

// obs.subscribe(...) | disposed_by(bag)
struct disposed_by {
  explicit disposed_by(dispose_bag& b) noexcept : bag(&b) {}
  void operator()(disposable d) const { bag->add(std::move(d)); }

  dispose_bag* bag;
};

} // namespace ripple
