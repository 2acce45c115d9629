#include "clawlink/storage/secret_store.hpp"

#include "clawlink/common/fs.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string_view>

#include <sys/stat.h>

namespace clawlink::storage {

namespace {

constexpr std::size_t NONCE_SIZE = 12;
constexpr std::size_t TAG_SIZE = 16;
constexpr const char *KEY_FILENAME = "secrets.key";

std::string entry_aad(const std::string &service, const std::string &account) {
  std::string aad = service;
  aad.push_back('\0');
  aad += account;
  return aad;
}

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

std::string_view as_text(const SecretBytes &bytes) {
  return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
}

} // namespace

std::string node_token_account(const std::string &node_id) { return "clawlink-" + node_id; }

common::Result<std::optional<std::string>> ISecretStore::get_string(const std::string &service,
                                                                    const std::string &account) {
  const auto data = get_data(service, account);
  if (!data.ok()) {
    return common::Result<std::optional<std::string>>::failure(data.error());
  }
  if (!data.value().has_value()) {
    return common::Result<std::optional<std::string>>::success(std::nullopt);
  }
  const auto &bytes = *data.value();
  return common::Result<std::optional<std::string>>::success(
      std::string(bytes.begin(), bytes.end()));
}

common::Status ISecretStore::set_string(const std::string &service, const std::string &account,
                                        const std::string &value) {
  return set_data(service, account, SecretBytes(value.begin(), value.end()));
}

common::Result<std::optional<SecretBytes>>
InMemorySecretStore::get_data(const std::string &service, const std::string &account) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find({service, account});
  if (it == entries_.end()) {
    return common::Result<std::optional<SecretBytes>>::success(std::nullopt);
  }
  return common::Result<std::optional<SecretBytes>>::success(it->second);
}

common::Status InMemorySecretStore::set_data(const std::string &service,
                                             const std::string &account,
                                             const SecretBytes &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[{service, account}] = value;
  return common::Status::success();
}

common::Status InMemorySecretStore::remove(const std::string &service,
                                           const std::string &account) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.erase({service, account});
  return common::Status::success();
}

EncryptedFileSecretStore::EncryptedFileSecretStore(std::filesystem::path dir)
    : dir_(std::move(dir)) {}

std::filesystem::path EncryptedFileSecretStore::entry_path(const std::string &service,
                                                           const std::string &account) const {
  return dir_ / (sha256_hex(entry_aad(service, account)) + ".secret");
}

common::Result<SecretKey> EncryptedFileSecretStore::load_or_create_key() {
  if (key_.has_value()) {
    return common::Result<SecretKey>::success(*key_);
  }

  const auto dir = common::ensure_dir(dir_);
  if (!dir.ok()) {
    return common::Result<SecretKey>::failure(dir.error());
  }
  if (::chmod(dir_.c_str(), 0700) != 0) {
    return common::Result<SecretKey>::failure("Failed to restrict " + dir_.string());
  }

  const std::filesystem::path path = dir_ / KEY_FILENAME;
  if (std::filesystem::exists(path)) {
    const auto contents = common::read_file(path);
    if (!contents.ok()) {
      return common::Result<SecretKey>::failure(contents.error());
    }
    SecretKey key{};
    if (contents.value().size() != key.size()) {
      return common::Result<SecretKey>::failure("Key file has invalid size");
    }
    std::copy(contents.value().begin(), contents.value().end(), key.begin());
    key_ = key;
    return common::Result<SecretKey>::success(key);
  }

  SecretKey key{};
  if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
    return common::Result<SecretKey>::failure("Failed to generate secret key");
  }
  const auto written = common::write_file_atomic(
      path, std::string_view(reinterpret_cast<const char *>(key.data()), key.size()), 0600);
  if (!written.ok()) {
    return common::Result<SecretKey>::failure(written.error());
  }
  key_ = key;
  return common::Result<SecretKey>::success(key);
}

common::Result<std::optional<SecretBytes>>
EncryptedFileSecretStore::get_data(const std::string &service, const std::string &account) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto path = entry_path(service, account);
  if (!std::filesystem::exists(path)) {
    return common::Result<std::optional<SecretBytes>>::success(std::nullopt);
  }

  const auto key = load_or_create_key();
  if (!key.ok()) {
    return common::Result<std::optional<SecretBytes>>::failure(key.error());
  }
  const auto contents = common::read_file(path);
  if (!contents.ok()) {
    return common::Result<std::optional<SecretBytes>>::failure(contents.error());
  }
  const SecretBytes sealed(contents.value().begin(), contents.value().end());
  auto plaintext = open_secret(key.value(), entry_aad(service, account), sealed);
  if (!plaintext.ok()) {
    return common::Result<std::optional<SecretBytes>>::failure(plaintext.error());
  }
  return common::Result<std::optional<SecretBytes>>::success(std::move(plaintext.value()));
}

common::Status EncryptedFileSecretStore::set_data(const std::string &service,
                                                  const std::string &account,
                                                  const SecretBytes &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto key = load_or_create_key();
  if (!key.ok()) {
    return common::Status::error(key.error());
  }
  const auto sealed = seal_secret(key.value(), entry_aad(service, account), value);
  if (!sealed.ok()) {
    return common::Status::error(sealed.error());
  }
  return common::write_file_atomic(entry_path(service, account), as_text(sealed.value()), 0600);
}

common::Status EncryptedFileSecretStore::remove(const std::string &service,
                                                const std::string &account) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  std::filesystem::remove(entry_path(service, account), ec);
  if (ec) {
    return common::Status::error("Failed to remove secret: " + ec.message());
  }
  return common::Status::success();
}

common::Result<SecretBytes> seal_secret(const SecretKey &key, const std::string &associated_data,
                                        const SecretBytes &plaintext) {
  std::array<unsigned char, NONCE_SIZE> nonce{};
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    return common::Result<SecretBytes>::failure("Failed to generate nonce");
  }

  EVP_CIPHER_CTX *ctx = EVP_CIPHER_CTX_new();
  if (ctx == nullptr) {
    return common::Result<SecretBytes>::failure("Failed to create cipher context");
  }
  auto cleanup = [&ctx]() { EVP_CIPHER_CTX_free(ctx); };

  SecretBytes sealed(NONCE_SIZE + plaintext.size() + TAG_SIZE);
  std::copy(nonce.begin(), nonce.end(), sealed.begin());
  unsigned char *out = sealed.data() + NONCE_SIZE;
  int out_len = 0;
  int total_len = 0;

  if (EVP_EncryptInit_ex(ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data()) != 1) {
    cleanup();
    return common::Result<SecretBytes>::failure("Encrypt init failed");
  }
  if (!associated_data.empty() &&
      EVP_EncryptUpdate(ctx, nullptr, &out_len,
                        reinterpret_cast<const unsigned char *>(associated_data.data()),
                        static_cast<int>(associated_data.size())) != 1) {
    cleanup();
    return common::Result<SecretBytes>::failure("Failed to bind associated data");
  }
  if (EVP_EncryptUpdate(ctx, out, &out_len, plaintext.data(),
                        static_cast<int>(plaintext.size())) != 1) {
    cleanup();
    return common::Result<SecretBytes>::failure("Encrypt update failed");
  }
  total_len += out_len;
  if (EVP_EncryptFinal_ex(ctx, out + total_len, &out_len) != 1) {
    cleanup();
    return common::Result<SecretBytes>::failure("Encrypt final failed");
  }
  total_len += out_len;

  unsigned char *tag = sealed.data() + NONCE_SIZE + total_len;
  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_GET_TAG, TAG_SIZE, tag) != 1) {
    cleanup();
    return common::Result<SecretBytes>::failure("Failed to get tag");
  }

  cleanup();
  sealed.resize(NONCE_SIZE + static_cast<std::size_t>(total_len) + TAG_SIZE);
  return common::Result<SecretBytes>::success(std::move(sealed));
}

common::Result<SecretBytes> open_secret(const SecretKey &key, const std::string &associated_data,
                                        const SecretBytes &sealed) {
  if (sealed.size() < NONCE_SIZE + TAG_SIZE) {
    return common::Result<SecretBytes>::failure("Ciphertext too short");
  }

  const std::size_t data_size = sealed.size() - NONCE_SIZE - TAG_SIZE;
  const unsigned char *nonce = sealed.data();
  const unsigned char *data = sealed.data() + NONCE_SIZE;
  const unsigned char *tag = data + data_size;

  EVP_CIPHER_CTX *ctx = EVP_CIPHER_CTX_new();
  if (ctx == nullptr) {
    return common::Result<SecretBytes>::failure("Failed to create cipher context");
  }
  auto cleanup = [&ctx]() { EVP_CIPHER_CTX_free(ctx); };

  SecretBytes plaintext(data_size + TAG_SIZE);
  int out_len = 0;
  int total_len = 0;

  if (EVP_DecryptInit_ex(ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce) != 1) {
    cleanup();
    return common::Result<SecretBytes>::failure("Decrypt init failed");
  }
  if (!associated_data.empty() &&
      EVP_DecryptUpdate(ctx, nullptr, &out_len,
                        reinterpret_cast<const unsigned char *>(associated_data.data()),
                        static_cast<int>(associated_data.size())) != 1) {
    cleanup();
    return common::Result<SecretBytes>::failure("Failed to bind associated data");
  }
  if (EVP_DecryptUpdate(ctx, plaintext.data(), &out_len, data, static_cast<int>(data_size)) != 1) {
    cleanup();
    return common::Result<SecretBytes>::failure("Decrypt update failed");
  }
  total_len += out_len;

  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_TAG, TAG_SIZE,
                          const_cast<unsigned char *>(tag)) != 1) {
    cleanup();
    return common::Result<SecretBytes>::failure("Failed to set tag");
  }
  if (EVP_DecryptFinal_ex(ctx, plaintext.data() + total_len, &out_len) != 1) {
    cleanup();
    return common::Result<SecretBytes>::failure("Decryption failed");
  }
  total_len += out_len;

  cleanup();
  plaintext.resize(static_cast<std::size_t>(total_len));
  return common::Result<SecretBytes>::success(std::move(plaintext));
}

} // namespace clawlink::storage
