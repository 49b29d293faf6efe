#pragma once

#include <cstdint>
#include <string>

namespace fleetlink::credentials {

/*
  Broker connection settings as held in live memory.

  `password` is plaintext only here; at rest it exists only inside a sealed
  record (see CredentialStore).
*/
struct BrokerConfig {
  std::string host{"127.0.0.1"};
  uint32_t    port{1883};
  bool        use_tls{false};
  std::string username;
  std::string password;
  std::string client_id;
  std::string client_id_prefix{"fleetlink"};
  uint32_t    keepalive_sec{60};
  std::string ca_file;
};

// mqtt://host:port or mqtts://host:port
std::string BrokerUrl(const BrokerConfig& config);

} // namespace fleetlink::credentials
