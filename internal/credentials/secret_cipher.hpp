#pragma once

#include <string>
#include <string_view>

namespace fleetlink::credentials {

struct SealedSecret {
  std::string algorithm;
  std::string nonce;
  std::string ciphertext;
  std::string tag;
};

/*
  Authenticated encryption of credential records (AES-256-GCM, OpenSSL EVP).

  Every Seal() draws a fresh 96-bit nonce. Open() throws util::ConfigError on
  any authentication failure, so a record is either fully recovered or not at
  all.
*/
class SecretCipher {
 public:
  static constexpr std::string_view kAlgorithm = "AES-256-GCM";
  static constexpr std::size_t      kKeySize   = 32;
  static constexpr std::size_t      kNonceSize = 12;
  static constexpr std::size_t      kTagSize   = 16;

  explicit SecretCipher(std::string key);
  ~SecretCipher();

  SecretCipher(const SecretCipher&)            = delete;
  SecretCipher& operator=(const SecretCipher&) = delete;

  SealedSecret Seal(std::string_view plaintext) const;
  std::string  Open(const SealedSecret& sealed) const;

  static std::string GenerateKey();

  /*
    Resolves the record key: FLEETLINK_CREDENTIAL_KEY (64 hex characters)
    when set, otherwise `key_file`, created with mode 0600 on first use.
  */
  static std::string LoadOrCreateKey(const std::string& key_file);

 private:
  std::string key_;
};

} // namespace fleetlink::credentials
