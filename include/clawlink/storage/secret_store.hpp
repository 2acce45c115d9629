#pragma once

#include "clawlink/common/result.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace clawlink::storage {

using SecretBytes = std::vector<std::uint8_t>;

constexpr const char *NODE_TOKEN_SERVICE = "clawlink-node-token";

/// Account name under which the pairing token for `node_id` is stored.
[[nodiscard]] std::string node_token_account(const std::string &node_id);

/// Opaque key/value store for secrets addressed by (service, account).
class ISecretStore {
public:
  virtual ~ISecretStore() = default;

  [[nodiscard]] virtual common::Result<std::optional<SecretBytes>>
  get_data(const std::string &service, const std::string &account) = 0;
  [[nodiscard]] virtual common::Status set_data(const std::string &service,
                                                const std::string &account,
                                                const SecretBytes &value) = 0;
  /// Removing an absent entry succeeds.
  [[nodiscard]] virtual common::Status remove(const std::string &service,
                                              const std::string &account) = 0;

  [[nodiscard]] common::Result<std::optional<std::string>> get_string(const std::string &service,
                                                                      const std::string &account);
  [[nodiscard]] common::Status set_string(const std::string &service, const std::string &account,
                                          const std::string &value);
};

class InMemorySecretStore final : public ISecretStore {
public:
  [[nodiscard]] common::Result<std::optional<SecretBytes>>
  get_data(const std::string &service, const std::string &account) override;
  [[nodiscard]] common::Status set_data(const std::string &service, const std::string &account,
                                        const SecretBytes &value) override;
  [[nodiscard]] common::Status remove(const std::string &service,
                                      const std::string &account) override;

private:
  std::mutex mutex_;
  std::map<std::pair<std::string, std::string>, SecretBytes> entries_;
};

using SecretKey = std::array<unsigned char, 32>;

/// One ChaCha20-Poly1305 sealed file per entry under `dir`, keyed by a 32-byte
/// key file (`secrets.key`, mode 0600) created on first use.
class EncryptedFileSecretStore final : public ISecretStore {
public:
  explicit EncryptedFileSecretStore(std::filesystem::path dir);

  [[nodiscard]] common::Result<std::optional<SecretBytes>>
  get_data(const std::string &service, const std::string &account) override;
  [[nodiscard]] common::Status set_data(const std::string &service, const std::string &account,
                                        const SecretBytes &value) override;
  [[nodiscard]] common::Status remove(const std::string &service,
                                      const std::string &account) override;

  [[nodiscard]] std::filesystem::path entry_path(const std::string &service,
                                                 const std::string &account) const;

private:
  [[nodiscard]] common::Result<SecretKey> load_or_create_key();

  std::filesystem::path dir_;
  std::mutex mutex_;
  std::optional<SecretKey> key_;
};

[[nodiscard]] common::Result<SecretBytes> seal_secret(const SecretKey &key,
                                                      const std::string &associated_data,
                                                      const SecretBytes &plaintext);
[[nodiscard]] common::Result<SecretBytes> open_secret(const SecretKey &key,
                                                      const std::string &associated_data,
                                                      const SecretBytes &sealed);

} // namespace clawlink::storage
