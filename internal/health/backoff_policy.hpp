#pragma once

#include <chrono>
#include <cstdint>

namespace fleetlink::health {

/*
  Exponential backoff: the delay after the n-th consecutive failed attempt
  is min(base * 2^(n-1), max). After max_attempts failures the caller gives up.
*/
class BackoffPolicy {
 public:
  BackoffPolicy(std::chrono::milliseconds base, std::chrono::milliseconds max, uint32_t max_attempts);

  std::chrono::milliseconds DelayAfter(uint32_t failed_attempts) const;

  bool Exhausted(uint32_t failed_attempts) const {
    return failed_attempts >= max_attempts_;
  }

  uint32_t MaxAttempts() const {
    return max_attempts_;
  }

 private:
  std::chrono::milliseconds base_;
  std::chrono::milliseconds max_;
  uint32_t                  max_attempts_;
};

} // namespace fleetlink::health
