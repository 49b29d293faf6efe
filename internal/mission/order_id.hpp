#pragma once

#include <functional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace fleetlink::mission {

// <prefix>-YYYYMMDD-HHMMSS (UTC); "-2", "-3", ... appended while `taken` reports a collision.
std::string GenerateOrderId(std::string_view prefix, util::TimePoint now, const std::function<bool(const std::string&)>& taken);

// Non-empty, [A-Za-z0-9_-] only.
bool IsValidOrderId(std::string_view order_id);

} // namespace fleetlink::mission
