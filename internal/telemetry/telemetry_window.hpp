#pragma once

#include <cstddef>
#include <deque>
#include <vector>

namespace fleetlink::telemetry {

/*
  Fixed-capacity FIFO of the most recent events.

  Push() past capacity evicts the oldest entry, so memory stays bounded no
  matter how long the fleet runs. Not synchronized; the owner locks.
*/
template <typename T>
class TelemetryWindow {
 public:
  explicit TelemetryWindow(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
  }

  void Push(T item) {
    items_.push_back(std::move(item));
    while (items_.size() > capacity_) {
      items_.pop_front();
      ++evicted_;
    }
  }

  // Oldest first.
  std::vector<T> Items() const {
    return std::vector<T>(items_.begin(), items_.end());
  }

  std::size_t Size() const {
    return items_.size();
  }

  std::size_t Capacity() const {
    return capacity_;
  }

  std::size_t Evicted() const {
    return evicted_;
  }

 private:
  std::size_t   capacity_;
  std::size_t   evicted_ = 0;
  std::deque<T> items_;
};

} // namespace fleetlink::telemetry
