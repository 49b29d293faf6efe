#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace fleetlink::util {

/*
  Central error types.

  These get translated later to gRPC status codes (internal/grpc/grpc_error).
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Stored credentials could not be decrypted or parsed. Requires reconfiguration.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConnectionError : public std::runtime_error {
 public:
  enum class Kind {
    kDns,
    kTls,
    kAuth,
    kTimeout,
    kNetwork,
    kCancelled,
  };

  ConnectionError(Kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  Kind kind() const {
    return kind_;
  }

 private:
  Kind kind_;
};

std::string_view ToString(ConnectionError::Kind kind);

// Malformed or unsupported inbound message. Only the offending message is dropped.
class ProtocolError : public std::runtime_error {
 public:
  explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Publish attempted while the broker session is not connected.
class PublishError : public std::runtime_error {
 public:
  explicit PublishError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Invalid order shape, unknown vehicle or acknowledgement timeout.
class MissionError : public std::runtime_error {
 public:
  explicit MissionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace fleetlink::util
