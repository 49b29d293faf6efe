#include "secret_cipher.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fleetlink::credentials {

using fleetlink::util::ConfigError;

namespace {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const {
    EVP_CIPHER_CTX_free(ctx);
  }
};

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

std::string OpenSslError(const char* what) {
  char buf[256] = {0};
  ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
  return std::string(what) + ": " + buf;
}

CipherCtx NewCtx() {
  CipherCtx ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    throw std::runtime_error(OpenSslError("EVP_CIPHER_CTX_new"));
  }
  return ctx;
}

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::string DecodeHexKey(const std::string& hex) {
  if (hex.size() != SecretCipher::kKeySize * 2) {
    throw ConfigError("FLEETLINK_CREDENTIAL_KEY must be 64 hex characters");
  }
  std::string key(SecretCipher::kKeySize, '\0');
  for (std::size_t i = 0; i < key.size(); ++i) {
    const int hi = HexNibble(hex[2 * i]);
    const int lo = HexNibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      throw ConfigError("FLEETLINK_CREDENTIAL_KEY contains non-hex characters");
    }
    key[i] = static_cast<char>((hi << 4) | lo);
  }
  return key;
}

} // namespace

SecretCipher::SecretCipher(std::string key) : key_(std::move(key)) {
  if (key_.size() != kKeySize) {
    throw ConfigError("credential key must be 32 bytes");
  }
}

SecretCipher::~SecretCipher() {
  OPENSSL_cleanse(key_.data(), key_.size());
}

SealedSecret SecretCipher::Seal(std::string_view plaintext) const {
  SealedSecret sealed;
  sealed.algorithm = std::string(kAlgorithm);
  sealed.nonce.assign(kNonceSize, '\0');
  if (RAND_bytes(reinterpret_cast<unsigned char*>(sealed.nonce.data()), static_cast<int>(kNonceSize)) != 1) {
    throw std::runtime_error(OpenSslError("RAND_bytes"));
  }

  auto ctx = NewCtx();
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, reinterpret_cast<const unsigned char*>(key_.data()),
                         reinterpret_cast<const unsigned char*>(sealed.nonce.data())) != 1) {
    throw std::runtime_error(OpenSslError("EVP_EncryptInit_ex"));
  }

  // aad binds the algorithm identifier to the record
  int len = 0;
  if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, reinterpret_cast<const unsigned char*>(sealed.algorithm.data()),
                        static_cast<int>(sealed.algorithm.size())) != 1) {
    throw std::runtime_error(OpenSslError("EVP_EncryptUpdate(aad)"));
  }

  sealed.ciphertext.assign(plaintext.size(), '\0');
  if (!plaintext.empty() &&
      EVP_EncryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(sealed.ciphertext.data()), &len,
                        reinterpret_cast<const unsigned char*>(plaintext.data()), static_cast<int>(plaintext.size())) != 1) {
    throw std::runtime_error(OpenSslError("EVP_EncryptUpdate"));
  }

  int final_len = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(sealed.ciphertext.data()) + len, &final_len) != 1) {
    throw std::runtime_error(OpenSslError("EVP_EncryptFinal_ex"));
  }

  sealed.tag.assign(kTagSize, '\0');
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), sealed.tag.data()) != 1) {
    throw std::runtime_error(OpenSslError("EVP_CTRL_GCM_GET_TAG"));
  }
  return sealed;
}

std::string SecretCipher::Open(const SealedSecret& sealed) const {
  if (sealed.algorithm != kAlgorithm) {
    throw ConfigError("unsupported credential algorithm: " + sealed.algorithm);
  }
  if (sealed.nonce.size() != kNonceSize || sealed.tag.size() != kTagSize) {
    throw ConfigError("credential record is corrupted");
  }

  auto ctx = NewCtx();
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, reinterpret_cast<const unsigned char*>(key_.data()),
                         reinterpret_cast<const unsigned char*>(sealed.nonce.data())) != 1) {
    throw std::runtime_error(OpenSslError("EVP_DecryptInit_ex"));
  }

  int len = 0;
  if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, reinterpret_cast<const unsigned char*>(sealed.algorithm.data()),
                        static_cast<int>(sealed.algorithm.size())) != 1) {
    throw ConfigError("credential record is corrupted");
  }

  std::string plaintext(sealed.ciphertext.size(), '\0');
  if (!sealed.ciphertext.empty() &&
      EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()), &len,
                        reinterpret_cast<const unsigned char*>(sealed.ciphertext.data()), static_cast<int>(sealed.ciphertext.size())) != 1) {
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    throw ConfigError("credential record is corrupted");
  }

  std::string tag = sealed.tag;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) {
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    throw std::runtime_error(OpenSslError("EVP_CTRL_GCM_SET_TAG"));
  }

  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()) + len, &final_len) != 1) {
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    throw ConfigError("credential record failed authentication (wrong key or corrupted store)");
  }
  return plaintext;
}

std::string SecretCipher::GenerateKey() {
  std::string key(kKeySize, '\0');
  if (RAND_bytes(reinterpret_cast<unsigned char*>(key.data()), static_cast<int>(kKeySize)) != 1) {
    throw std::runtime_error(OpenSslError("RAND_bytes"));
  }
  return key;
}

std::string SecretCipher::LoadOrCreateKey(const std::string& key_file) {
  if (const char* hex = std::getenv("FLEETLINK_CREDENTIAL_KEY")) {
    return DecodeHexKey(hex);
  }

  const std::filesystem::path path(key_file);
  if (std::filesystem::exists(path)) {
    std::ifstream in(path, std::ios::binary);
    std::string   key((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (key.size() != kKeySize) {
      throw ConfigError("credential key file has unexpected size: " + key_file);
    }
    return key;
  }

  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }

  auto key = GenerateKey();

  // created owner-only; the key never exists on disk with wider permissions
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR | S_IWUSR);
  if (fd < 0) {
    throw ConfigError("cannot create credential key file " + key_file + ": " + std::strerror(errno));
  }
  std::size_t written = 0;
  while (written < key.size()) {
    const auto n = ::write(fd, key.data() + written, key.size() - written);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      const int err = errno;
      ::close(fd);
      std::filesystem::remove(path);
      throw ConfigError("failed to write credential key file " + key_file + ": " + std::strerror(err));
    }
    written += static_cast<std::size_t>(n);
  }
  if (::fsync(fd) != 0 || ::close(fd) != 0) {
    std::filesystem::remove(path);
    throw ConfigError("failed to flush credential key file " + key_file + ": " + std::strerror(errno));
  }

  struct stat st {};
  if (::stat(path.c_str(), &st) != 0 || (st.st_mode & (S_IRWXG | S_IRWXO)) != 0) {
    throw ConfigError("credential key file is not owner-only: " + key_file);
  }

  FLEETLINK_LOG_INFO("Generated new credential key", {fleetlink::observability::StringField("path", key_file)});
  return key;
}

} // namespace fleetlink::credentials
