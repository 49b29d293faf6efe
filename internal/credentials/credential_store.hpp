#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "broker_config.hpp"
#include "secret_cipher.hpp"

namespace fleetlink::db::sqlite {
class SqliteDB;
}

namespace fleetlink::runtime::config {
class BrokerConfig;
}

namespace fleetlink::credentials {

/*
  Encrypted persistence of the broker configuration.

  Table `secure_config` holds one sealed record per config key:
      (config_key, algorithm, nonce, ciphertext, tag, updated_at_ms)

  The whole BrokerConfig is serialized and sealed, so no field (in
  particular the password) is ever written in plaintext.
*/
class CredentialStore {
 public:
  CredentialStore(std::shared_ptr<db::sqlite::SqliteDB> db, std::shared_ptr<SecretCipher> cipher);

  void Put(const BrokerConfig& config);

  // Default BrokerConfig when nothing is stored. Throws util::ConfigError when
  // the stored record cannot be decrypted or parsed.
  BrokerConfig Get() const;

  bool HasStoredConfig() const;

 private:
  static constexpr const char* kBrokerKey = "broker";

  void Bootstrap();

  std::shared_ptr<db::sqlite::SqliteDB> db_;
  std::shared_ptr<SecretCipher>         cipher_;
  mutable std::mutex                    mutex_;
};

/*
  Effective broker config: the stored record, overlaid by every non-empty
  field from the process configuration (file + environment).
*/
BrokerConfig ResolveBrokerConfig(const BrokerConfig& stored, const fleetlink::runtime::config::BrokerConfig& overrides);

} // namespace fleetlink::credentials
