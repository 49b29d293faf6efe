#include "credential_store.hpp"

#include <openssl/crypto.h>

#include "config/config.pb.h"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fleetlink::credentials {

using fleetlink::util::ConfigError;

namespace {

fleetlink::runtime::config::BrokerConfig ToProto(const BrokerConfig& config) {
  fleetlink::runtime::config::BrokerConfig proto;
  proto.set_host(config.host);
  proto.set_port(config.port);
  proto.set_use_tls(config.use_tls);
  proto.set_username(config.username);
  proto.set_password(config.password);
  proto.set_client_id(config.client_id);
  proto.set_client_id_prefix(config.client_id_prefix);
  proto.set_keepalive_sec(config.keepalive_sec);
  proto.set_ca_file(config.ca_file);
  return proto;
}

BrokerConfig FromProto(const fleetlink::runtime::config::BrokerConfig& proto) {
  BrokerConfig config;
  config.host             = proto.host();
  config.port             = proto.port();
  config.use_tls          = proto.use_tls();
  config.username         = proto.username();
  config.password         = proto.password();
  config.client_id        = proto.client_id();
  config.client_id_prefix = proto.client_id_prefix();
  config.keepalive_sec    = proto.keepalive_sec();
  config.ca_file          = proto.ca_file();
  return config;
}

} // namespace

std::string BrokerUrl(const BrokerConfig& config) {
  return std::string(config.use_tls ? "mqtts" : "mqtt") + "://" + config.host + ":" + std::to_string(config.port);
}

CredentialStore::CredentialStore(std::shared_ptr<db::sqlite::SqliteDB> db, std::shared_ptr<SecretCipher> cipher)
    : db_(std::move(db)), cipher_(std::move(cipher)) {
  Bootstrap();
}

void CredentialStore::Bootstrap() {
  db_->Exec(
      "CREATE TABLE IF NOT EXISTS secure_config ("
      "config_key TEXT PRIMARY KEY, "
      "algorithm TEXT NOT NULL, "
      "nonce BLOB NOT NULL, "
      "ciphertext BLOB NOT NULL, "
      "tag BLOB NOT NULL, "
      "updated_at_ms INTEGER NOT NULL);");
}

void CredentialStore::Put(const BrokerConfig& config) {
  std::string plaintext;
  if (!ToProto(config).SerializeToString(&plaintext)) {
    throw std::runtime_error("failed to serialize broker config");
  }

  SealedSecret sealed;
  try {
    sealed = cipher_->Seal(plaintext);
  } catch (...) {
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    throw;
  }
  OPENSSL_cleanse(plaintext.data(), plaintext.size());

  std::lock_guard lock(mutex_);
  db::sqlite::Statement stmt(*db_,
                             "INSERT OR REPLACE INTO secure_config(config_key, algorithm, nonce, ciphertext, tag, updated_at_ms) "
                             "VALUES(?,?,?,?,?,?);");
  stmt.BindText(1, kBrokerKey);
  stmt.BindText(2, sealed.algorithm);
  stmt.BindBlob(3, sealed.nonce);
  stmt.BindBlob(4, sealed.ciphertext);
  stmt.BindBlob(5, sealed.tag);
  stmt.BindInt64(6, static_cast<sqlite3_int64>(util::ToUnixMillis(util::Now())));
  stmt.Step();

  FLEETLINK_LOG_INFO("Broker configuration saved", {fleetlink::observability::StringField("broker", BrokerUrl(config))});
}

BrokerConfig CredentialStore::Get() const {
  SealedSecret sealed;
  {
    std::lock_guard       lock(mutex_);
    db::sqlite::Statement stmt(*db_, "SELECT algorithm, nonce, ciphertext, tag FROM secure_config WHERE config_key = ?;");
    stmt.BindText(1, kBrokerKey);
    if (!stmt.Step()) {
      return BrokerConfig{};
    }
    sealed.algorithm  = stmt.ColumnText(0);
    sealed.nonce      = stmt.ColumnBlob(1);
    sealed.ciphertext = stmt.ColumnBlob(2);
    sealed.tag        = stmt.ColumnBlob(3);
  }

  std::string                              plaintext = cipher_->Open(sealed);
  fleetlink::runtime::config::BrokerConfig proto;
  const bool                               parsed = proto.ParseFromString(plaintext);
  OPENSSL_cleanse(plaintext.data(), plaintext.size());
  if (!parsed) {
    throw ConfigError("stored broker config is not a valid record");
  }
  return FromProto(proto);
}

bool CredentialStore::HasStoredConfig() const {
  std::lock_guard       lock(mutex_);
  db::sqlite::Statement stmt(*db_, "SELECT 1 FROM secure_config WHERE config_key = ?;");
  stmt.BindText(1, kBrokerKey);
  return stmt.Step();
}

BrokerConfig ResolveBrokerConfig(const BrokerConfig& stored, const fleetlink::runtime::config::BrokerConfig& overrides) {
  BrokerConfig effective = stored;
  if (!overrides.host().empty()) effective.host = overrides.host();
  if (overrides.port() != 0) effective.port = overrides.port();
  if (overrides.use_tls()) effective.use_tls = true;
  if (!overrides.username().empty()) effective.username = overrides.username();
  if (!overrides.password().empty()) effective.password = overrides.password();
  if (!overrides.client_id().empty()) effective.client_id = overrides.client_id();
  if (!overrides.client_id_prefix().empty()) effective.client_id_prefix = overrides.client_id_prefix();
  if (overrides.keepalive_sec() != 0) effective.keepalive_sec = overrides.keepalive_sec();
  if (!overrides.ca_file().empty()) effective.ca_file = overrides.ca_file();
  return effective;
}

} // namespace fleetlink::credentials
