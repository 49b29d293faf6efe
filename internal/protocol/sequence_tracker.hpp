#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "topic.hpp"

namespace fleetlink::protocol {

/*
  Last accepted headerId per (vehicle, topic kind).

  A message at or below the baseline is a replay or arrived out of order
  and is rejected. Reset() drops every baseline of one vehicle so the next
  message on each topic is accepted unconditionally.
*/
class SequenceTracker {
 public:
  bool Admit(const std::string& vehicle_id, TopicKind kind, uint32_t header_id);

  void Reset(const std::string& vehicle_id);
  void Clear();

  std::optional<uint32_t> LastAccepted(const std::string& vehicle_id, TopicKind kind) const;

 private:
  using Key = std::pair<std::string, TopicKind>;

  mutable std::mutex      mutex_;
  std::map<Key, uint32_t> last_;
};

} // namespace fleetlink::protocol
