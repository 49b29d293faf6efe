#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace fleetlink::util {

/*
  UUID helpers

  Used for VDA5050 action ids and generated MQTT client ids.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Short lowercase hex token (2 * bytes characters).
std::string RandomToken(std::size_t bytes);

} // namespace fleetlink::util
