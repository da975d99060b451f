#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace rdsync::db::sqlite {

/*
  Owns the one sqlite3 connection behind the preference store.

  Opened in serialized mode with WAL and synchronous=FULL: a value written by
  Put is on disk when Put returns. Open failures throw std::runtime_error.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_.get();
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs statements that return no rows (pragmas, DDL); throws on error.
  void Exec(const std::string& sql);

 private:
  struct Closer {
    void operator()(sqlite3* db) const {
      sqlite3_close(db);
    }
  };

  void ApplyPragmas();

  std::string                      path_;
  std::unique_ptr<sqlite3, Closer> db_;
};

} // namespace rdsync::db::sqlite
