#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace fleetlink::util {

/*
  Time utilities — single place to control clock source later.

  Every component takes `now` from the caller so tests can drive time.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// RFC 3339 / ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.125Z
std::string              ToIso8601(TimePoint tp);
std::optional<TimePoint> ParseIso8601(const std::string& text);

} // namespace fleetlink::util
