#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace fleetlink::util {

/*
  Shared cell holding a small trivially-copyable value (an enum status).

  Load() is a single atomic read and never blocks. Store() notifies
  subscribers on change, outside the subscriber lock.
*/
template <typename T>
class ObservableCell {
 public:
  using Listener = std::function<void(T previous, T current)>;

  explicit ObservableCell(T initial) : value_(initial) {
  }

  T Load() const {
    return value_.load(std::memory_order_acquire);
  }

  // Returns true if the value changed.
  bool Store(T next) {
    const T previous = value_.exchange(next, std::memory_order_acq_rel);
    if (previous == next) {
      return false;
    }
    version_.fetch_add(1, std::memory_order_acq_rel);

    std::vector<Listener> listeners;
    {
      std::lock_guard lock(listeners_mutex_);
      listeners = listeners_;
    }
    for (const auto& listener : listeners) {
      listener(previous, next);
    }
    return true;
  }

  uint64_t Version() const {
    return version_.load(std::memory_order_acquire);
  }

  void Subscribe(Listener listener) {
    std::lock_guard lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
  }

 private:
  std::atomic<T>        value_;
  std::atomic<uint64_t> version_{0};

  std::mutex            listeners_mutex_;
  std::vector<Listener> listeners_;
};

} // namespace fleetlink::util
