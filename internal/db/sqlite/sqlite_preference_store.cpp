#include "sqlite_preference_store.hpp"

#include <sqlite3.h>

namespace rdsync::db::sqlite {

using rdsync::db::ErrorCode;
using rdsync::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  if (!t) return {};
  return std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col)));
}

SqlitePreferenceStore::SqlitePreferenceStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  BootstrapSchema();
}

void SqlitePreferenceStore::BootstrapSchema() {
  db_->Exec("CREATE TABLE IF NOT EXISTS preferences (key TEXT PRIMARY KEY, value TEXT NOT NULL);");
  db_->Exec("SELECT key,value FROM preferences LIMIT 1;");
}

Result SqlitePreferenceStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_READONLY:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<std::string> SqlitePreferenceStore::Get(const std::string& key) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  const char*   sql = "SELECT value FROM preferences WHERE key=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return std::nullopt;

  BindText(st, 1, key);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto value = ColText(st, 0);
  sqlite3_finalize(st);
  return value;
}

std::vector<std::string> SqlitePreferenceStore::Keys(const std::string& prefix) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  // substr comparison keeps LIKE wildcards in keys harmless
  const char*   sql = "SELECT key FROM preferences WHERE substr(key,1,?)=? ORDER BY key;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return {};

  sqlite3_bind_int(st, 1, static_cast<int>(prefix.size()));
  BindText(st, 2, prefix);

  std::vector<std::string> keys;
  while (sqlite3_step(st) == SQLITE_ROW) {
    keys.push_back(ColText(st, 0));
  }
  sqlite3_finalize(st);
  return keys;
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

Result SqlitePreferenceStore::Put(const std::string& key, const std::string& value) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  const char* sql = "INSERT INTO preferences(key,value) VALUES(?,?) "
                    "ON CONFLICT(key) DO UPDATE SET value=excluded.value;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, key);
  BindText(st, 2, value);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

Result SqlitePreferenceStore::Remove(const std::string& key) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  const char*   sql = "DELETE FROM preferences WHERE key=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, key);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

} // namespace rdsync::db::sqlite
