#include "internal/credentials/credential_store.hpp"

#include <sys/stat.h>

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/credentials/secret_cipher.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/util/errors.hpp"

namespace {

using fleetlink::credentials::BrokerConfig;
using fleetlink::credentials::CredentialStore;
using fleetlink::credentials::SecretCipher;
using fleetlink::db::sqlite::SqliteDB;

std::filesystem::path FreshPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "fleetlink_credential_store_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / name;
  std::filesystem::remove(path);
  return path;
}

BrokerConfig SampleConfig() {
  BrokerConfig config;
  config.host     = "broker.plant.local";
  config.port     = 8883;
  config.use_tls  = true;
  config.username = "fleet";
  config.password = "s3cret-passw0rd";
  config.ca_file  = "/etc/ssl/plant-ca.pem";
  return config;
}

bool FileContains(const std::filesystem::path& path, const std::string& needle) {
  std::ifstream in(path, std::ios::binary);
  std::string   content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return content.find(needle) != std::string::npos;
}

void TestMissingRecordYieldsDefaults() {
  auto            db = std::make_shared<SqliteDB>(FreshPath("empty.db").string());
  CredentialStore store(db, std::make_shared<SecretCipher>(SecretCipher::GenerateKey()));

  assert(!store.HasStoredConfig());
  const auto config = store.Get();
  assert(config.host == "127.0.0.1");
  assert(config.port == 1883);
  assert(!config.use_tls);
}

void TestPutThenGetRecoversEveryField() {
  const auto path = FreshPath("roundtrip.db");
  const auto key  = SecretCipher::GenerateKey();
  {
    auto db = std::make_shared<SqliteDB>(path.string());
    CredentialStore store(db, std::make_shared<SecretCipher>(key));
    store.Put(SampleConfig());
    assert(store.HasStoredConfig());
  }

  // reopened with the same key: survives a restart
  auto            db = std::make_shared<SqliteDB>(path.string());
  CredentialStore store(db, std::make_shared<SecretCipher>(key));
  const auto      config = store.Get();
  assert(config.host == "broker.plant.local");
  assert(config.port == 8883);
  assert(config.use_tls);
  assert(config.username == "fleet");
  assert(config.password == "s3cret-passw0rd");
  assert(config.ca_file == "/etc/ssl/plant-ca.pem");
}

void TestPasswordNeverStoredInPlaintext() {
  const auto path = FreshPath("plaintext.db");
  {
    auto db = std::make_shared<SqliteDB>(path.string());
    CredentialStore store(db, std::make_shared<SecretCipher>(SecretCipher::GenerateKey()));
    store.Put(SampleConfig());
  }
  assert(!FileContains(path, "s3cret-passw0rd"));
  assert(!FileContains(path, "broker.plant.local"));
}

void TestWrongKeyIsConfigError() {
  const auto path = FreshPath("wrong_key.db");
  {
    auto db = std::make_shared<SqliteDB>(path.string());
    CredentialStore store(db, std::make_shared<SecretCipher>(SecretCipher::GenerateKey()));
    store.Put(SampleConfig());
  }

  auto            db = std::make_shared<SqliteDB>(path.string());
  CredentialStore store(db, std::make_shared<SecretCipher>(SecretCipher::GenerateKey()));

  bool threw = false;
  try {
    (void)store.Get();
  } catch (const fleetlink::util::ConfigError&) {
    threw = true;
  }
  assert(threw && "a record sealed under another key must not be recovered");
}

void TestSealUsesFreshNonces() {
  SecretCipher cipher(SecretCipher::GenerateKey());
  const auto   a = cipher.Seal("same plaintext");
  const auto   b = cipher.Seal("same plaintext");
  assert(a.nonce.size() == SecretCipher::kNonceSize);
  assert(a.nonce != b.nonce);
  assert(a.ciphertext != b.ciphertext);
  assert(cipher.Open(a) == "same plaintext");

  auto tampered = a;
  tampered.ciphertext[0] ^= 0x01;
  bool threw = false;
  try {
    (void)cipher.Open(tampered);
  } catch (const fleetlink::util::ConfigError&) {
    threw = true;
  }
  assert(threw);
}

void TestKeyFileIsCreatedOnce() {
  ::unsetenv("FLEETLINK_CREDENTIAL_KEY");
  const auto path  = FreshPath("record.key");
  const auto first = SecretCipher::LoadOrCreateKey(path.string());
  assert(first.size() == SecretCipher::kKeySize);
  assert(std::filesystem::exists(path));
  assert(SecretCipher::LoadOrCreateKey(path.string()) == first);

  struct stat st {};
  assert(::stat(path.c_str(), &st) == 0);
  assert((st.st_mode & 0777) == 0600);
}

void TestKeyFileStaysOwnerOnlyUnderOpenUmask() {
  ::unsetenv("FLEETLINK_CREDENTIAL_KEY");
  const auto   path     = FreshPath("open_umask.key");
  const mode_t previous = ::umask(0);
  const auto   key      = SecretCipher::LoadOrCreateKey(path.string());
  ::umask(previous);

  assert(key.size() == SecretCipher::kKeySize);
  struct stat st {};
  assert(::stat(path.c_str(), &st) == 0);
  assert((st.st_mode & (S_IRWXG | S_IRWXO)) == 0);
}

void TestOverridesOverlayStoredRecord() {
  fleetlink::runtime::config::BrokerConfig overrides;
  overrides.set_host("override.local");
  overrides.set_password("from-env");

  const auto effective = fleetlink::credentials::ResolveBrokerConfig(SampleConfig(), overrides);
  assert(effective.host == "override.local");
  assert(effective.password == "from-env");
  assert(effective.port == 8883);
  assert(effective.username == "fleet");
  assert(effective.use_tls);
  assert(fleetlink::credentials::BrokerUrl(effective) == "mqtts://override.local:8883");
}

} // namespace

int main() {
  TestMissingRecordYieldsDefaults();
  TestPutThenGetRecoversEveryField();
  TestPasswordNeverStoredInPlaintext();
  TestWrongKeyIsConfigError();
  TestSealUsesFreshNonces();
  TestKeyFileIsCreatedOnce();
  TestKeyFileStaysOwnerOnlyUnderOpenUmask();
  TestOverridesOverlayStoredRecord();

  std::cout << "fleetlink_unit_credential_store: pass\n";
  return 0;
}
