#include "backoff_policy.hpp"

#include <algorithm>

namespace fleetlink::health {

BackoffPolicy::BackoffPolicy(std::chrono::milliseconds base, std::chrono::milliseconds max, uint32_t max_attempts)
    : base_(base), max_(std::max(base, max)), max_attempts_(max_attempts == 0 ? 1 : max_attempts) {
}

std::chrono::milliseconds BackoffPolicy::DelayAfter(uint32_t failed_attempts) const {
  if (failed_attempts == 0) {
    return std::chrono::milliseconds(0);
  }
  auto delay = base_;
  for (uint32_t i = 1; i < failed_attempts && delay < max_; ++i) {
    delay *= 2;
  }
  return std::min(delay, max_);
}

} // namespace fleetlink::health
