#include "errors.hpp"

namespace fleetlink::util {

std::string_view ToString(ConnectionError::Kind kind) {
  switch (kind) {
    case ConnectionError::Kind::kDns:
      return "dns";
    case ConnectionError::Kind::kTls:
      return "tls";
    case ConnectionError::Kind::kAuth:
      return "auth";
    case ConnectionError::Kind::kTimeout:
      return "timeout";
    case ConnectionError::Kind::kNetwork:
      return "network";
    case ConnectionError::Kind::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

} // namespace fleetlink::util
