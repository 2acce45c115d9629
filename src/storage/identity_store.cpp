#include "clawlink/storage/identity_store.hpp"

#include "clawlink/common/uuid.hpp"

namespace clawlink::storage {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

std::optional<std::string> column_text(sqlite3_stmt *stmt, const int index) {
  if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
    return std::nullopt;
  }
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, index));
  return std::string(text == nullptr ? "" : text);
}

} // namespace

common::Result<std::optional<gateway::DeviceIdentity>> InMemoryIdentityStore::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  return common::Result<std::optional<gateway::DeviceIdentity>>::success(identity_);
}

common::Status InMemoryIdentityStore::save(const gateway::DeviceIdentity &identity) {
  std::lock_guard<std::mutex> lock(mutex_);
  identity_ = identity;
  ++save_count_;
  return common::Status::success();
}

SqliteIdentityStore::SqliteIdentityStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {}

SqliteIdentityStore::~SqliteIdentityStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteIdentityStore::open_database() {
  if (db_ != nullptr) {
    return common::Status::success();
  }

  std::error_code ec;
  if (!db_path_.parent_path().empty()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
    if (ec) {
      return common::Status::error("Failed to create identity directory: " + ec.message());
    }
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    const std::string message = db_ == nullptr ? "sqlite open failed" : sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    return common::Status::error(message);
  }

  auto status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS device_identity (
  id INTEGER PRIMARY KEY CHECK (id = 1),
  node_id TEXT NOT NULL,
  display_name TEXT NOT NULL,
  pairing_token TEXT,
  paired_at INTEGER
);
)");
  if (!status.ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
  return status;
}

common::Result<std::optional<gateway::DeviceIdentity>> SqliteIdentityStore::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto status = open_database(); !status.ok()) {
    return common::Result<std::optional<gateway::DeviceIdentity>>::failure(status.error());
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "SELECT node_id, display_name, pairing_token, paired_at FROM device_identity WHERE id = 1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::optional<gateway::DeviceIdentity>>::failure(sqlite3_errmsg(db_));
  }

  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_DONE) {
    sqlite3_finalize(stmt);
    return common::Result<std::optional<gateway::DeviceIdentity>>::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    const std::string message = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    return common::Result<std::optional<gateway::DeviceIdentity>>::failure(message);
  }

  gateway::DeviceIdentity identity;
  identity.node_id = column_text(stmt, 0).value_or("");
  identity.display_name = column_text(stmt, 1).value_or("");
  identity.pairing_token = column_text(stmt, 2);
  if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
    identity.paired_at = gateway::from_epoch_ms(sqlite3_column_int64(stmt, 3));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::optional<gateway::DeviceIdentity>>::success(std::move(identity));
}

common::Status SqliteIdentityStore::save(const gateway::DeviceIdentity &identity) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto status = open_database(); !status.ok()) {
    return status;
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = R"(
INSERT INTO device_identity(id, node_id, display_name, pairing_token, paired_at)
VALUES(1, ?1, ?2, ?3, ?4)
ON CONFLICT(id) DO UPDATE SET
  node_id=excluded.node_id,
  display_name=excluded.display_name,
  pairing_token=excluded.pairing_token,
  paired_at=excluded.paired_at
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  sqlite3_bind_text(stmt, 1, identity.node_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, identity.display_name.c_str(), -1, SQLITE_TRANSIENT);
  if (identity.pairing_token.has_value()) {
    sqlite3_bind_text(stmt, 3, identity.pairing_token->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, 3);
  }
  if (identity.paired_at.has_value()) {
    sqlite3_bind_int64(stmt, 4, gateway::to_epoch_ms(*identity.paired_at));
  } else {
    sqlite3_bind_null(stmt, 4);
  }

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<gateway::DeviceIdentity> load_or_create_identity(IIdentityStore &store,
                                                                const std::string &display_name) {
  const auto loaded = store.load();
  if (!loaded.ok()) {
    return common::Result<gateway::DeviceIdentity>::failure(loaded.error());
  }
  if (loaded.value().has_value()) {
    return common::Result<gateway::DeviceIdentity>::success(*loaded.value());
  }

  gateway::DeviceIdentity identity;
  identity.node_id = "node-" + common::random_hex(4);
  identity.display_name = display_name;
  if (const auto saved = store.save(identity); !saved.ok()) {
    return common::Result<gateway::DeviceIdentity>::failure(saved.error());
  }
  return common::Result<gateway::DeviceIdentity>::success(std::move(identity));
}

} // namespace clawlink::storage
