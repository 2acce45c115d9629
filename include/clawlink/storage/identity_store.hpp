#pragma once

#include "clawlink/common/result.hpp"
#include "clawlink/gateway/types.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace clawlink::storage {

class IIdentityStore {
public:
  virtual ~IIdentityStore() = default;

  /// The stored identity, or nullopt on first launch.
  [[nodiscard]] virtual common::Result<std::optional<gateway::DeviceIdentity>> load() = 0;
  [[nodiscard]] virtual common::Status save(const gateway::DeviceIdentity &identity) = 0;
};

class InMemoryIdentityStore final : public IIdentityStore {
public:
  [[nodiscard]] common::Result<std::optional<gateway::DeviceIdentity>> load() override;
  [[nodiscard]] common::Status save(const gateway::DeviceIdentity &identity) override;

  [[nodiscard]] std::size_t save_count() const { return save_count_; }

private:
  std::mutex mutex_;
  std::optional<gateway::DeviceIdentity> identity_;
  std::size_t save_count_ = 0;
};

/// Single-row `device_identity` table in a local SQLite database.
class SqliteIdentityStore final : public IIdentityStore {
public:
  explicit SqliteIdentityStore(std::filesystem::path db_path);
  ~SqliteIdentityStore() override;

  SqliteIdentityStore(const SqliteIdentityStore &) = delete;
  SqliteIdentityStore &operator=(const SqliteIdentityStore &) = delete;

  [[nodiscard]] common::Result<std::optional<gateway::DeviceIdentity>> load() override;
  [[nodiscard]] common::Status save(const gateway::DeviceIdentity &identity) override;

private:
  [[nodiscard]] common::Status open_database();

  std::filesystem::path db_path_;
  std::mutex mutex_;
  sqlite3 *db_ = nullptr;
};

/// Loads the stored identity or creates, persists and returns a fresh one with a
/// generated `node-xxxxxxxx` id.
[[nodiscard]] common::Result<gateway::DeviceIdentity>
load_or_create_identity(IIdentityStore &store, const std::string &display_name);

} // namespace clawlink::storage
