#pragma once

#include <string_view>

namespace fleetlink::connection {

/*
  Broker session lifecycle:

      DISCONNECTED -> CONNECTING -> CONNECTED <-> DEGRADED
            ^              |            |            |
            +--------------+------------+------------+

  DEGRADED: a heartbeat probe was missed; inbound traffic is still accepted.
*/
enum class SessionState {
  kDisconnected,
  kConnecting,
  kConnected,
  kDegraded,
};

inline std::string_view ToString(SessionState state) {
  switch (state) {
    case SessionState::kDisconnected:
      return "DISCONNECTED";
    case SessionState::kConnecting:
      return "CONNECTING";
    case SessionState::kConnected:
      return "CONNECTED";
    case SessionState::kDegraded:
      return "DEGRADED";
  }
  return "UNKNOWN";
}

inline bool CanTransition(SessionState from, SessionState to) {
  if (to == SessionState::kDisconnected) {
    return true;
  }
  switch (from) {
    case SessionState::kDisconnected:
      return to == SessionState::kConnecting;
    case SessionState::kConnecting:
      return to == SessionState::kConnected;
    case SessionState::kConnected:
      return to == SessionState::kDegraded;
    case SessionState::kDegraded:
      return to == SessionState::kConnected;
  }
  return false;
}

inline bool IsUp(SessionState state) {
  return state == SessionState::kConnected || state == SessionState::kDegraded;
}

} // namespace fleetlink::connection
