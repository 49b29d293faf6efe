#include "sequence_tracker.hpp"

namespace fleetlink::protocol {

bool SequenceTracker::Admit(const std::string& vehicle_id, TopicKind kind, uint32_t header_id) {
  std::lock_guard lock(mutex_);
  auto [it, inserted] = last_.try_emplace(Key{vehicle_id, kind}, header_id);
  if (inserted) {
    return true;
  }
  if (header_id <= it->second) {
    return false;
  }
  it->second = header_id;
  return true;
}

void SequenceTracker::Reset(const std::string& vehicle_id) {
  std::lock_guard lock(mutex_);
  auto            it = last_.lower_bound(Key{vehicle_id, TopicKind::kOrder});
  while (it != last_.end() && it->first.first == vehicle_id) {
    it = last_.erase(it);
  }
}

void SequenceTracker::Clear() {
  std::lock_guard lock(mutex_);
  last_.clear();
}

std::optional<uint32_t> SequenceTracker::LastAccepted(const std::string& vehicle_id, TopicKind kind) const {
  std::lock_guard lock(mutex_);
  auto            it = last_.find(Key{vehicle_id, kind});
  if (it == last_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace fleetlink::protocol
