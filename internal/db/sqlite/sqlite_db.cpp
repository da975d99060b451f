#include "sqlite_db.hpp"

#include <stdexcept>

namespace rdsync::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

constexpr int kOpenFlags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  sqlite3*  raw = nullptr;
  const int rc  = sqlite3_open_v2(path_.c_str(), &raw, kOpenFlags, nullptr);
  db_.reset(raw);

  if (rc != SQLITE_OK) {
    throw std::runtime_error("open " + path_ + ": " + (raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc)));
  }

  ApplyPragmas();
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err) == SQLITE_OK) return;

  std::string msg = err ? err : sqlite3_errmsg(db_.get());
  sqlite3_free(err);
  throw std::runtime_error(path_ + ": " + msg);
}

void SqliteDB::ApplyPragmas() {
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=FULL;");

  if (sqlite3_busy_timeout(db_.get(), kBusyTimeoutMs) != SQLITE_OK) {
    throw std::runtime_error(path_ + ": busy_timeout: " + sqlite3_errmsg(db_.get()));
  }
}

} // namespace rdsync::db::sqlite
