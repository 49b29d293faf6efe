#include "order_id.hpp"

#include <ctime>

namespace fleetlink::mission {

std::string GenerateOrderId(std::string_view prefix, util::TimePoint now, const std::function<bool(const std::string&)>& taken) {
  const std::time_t secs = util::Clock::to_time_t(now);
  std::tm           utc{};
  gmtime_r(&secs, &utc);

  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &utc);

  const std::string base      = std::string(prefix.empty() ? "ORDER" : prefix) + "-" + stamp;
  std::string       candidate = base;
  for (int suffix = 2; taken && taken(candidate); ++suffix) {
    candidate = base + "-" + std::to_string(suffix);
  }
  return candidate;
}

bool IsValidOrderId(std::string_view order_id) {
  if (order_id.empty()) {
    return false;
  }
  for (const char c : order_id) {
    const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
    if (!ok) {
      return false;
    }
  }
  return true;
}

} // namespace fleetlink::mission
