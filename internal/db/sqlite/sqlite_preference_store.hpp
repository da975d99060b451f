#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/preference_store.hpp"
#include "sqlite_db.hpp"

namespace rdsync::db::sqlite {

/*
  Preference store backed by a single `preferences(key, value)` table.

  Each Put is one autocommit UPSERT, so a key is replaced atomically.
*/
class SqlitePreferenceStore final : public db::PreferenceStore {
 public:
  explicit SqlitePreferenceStore(std::shared_ptr<SqliteDB> db);

  std::optional<std::string> Get(const std::string& key) override;
  Result                     Put(const std::string& key, const std::string& value) override;
  Result                     Remove(const std::string& key) override;
  std::vector<std::string>   Keys(const std::string& prefix) override;

 private:
  static Result Translate(sqlite3* db, int rc);

  void BootstrapSchema();

  std::shared_ptr<SqliteDB> db_;

  // one connection, statements are not shared across threads
  std::mutex mutex_;
};

} // namespace rdsync::db::sqlite
