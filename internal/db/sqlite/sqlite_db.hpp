#pragma once

#include <sqlite3.h>

#include <string>

namespace mirrorguard::db::sqlite {

/*
  Owns the connection to the mirror database file.

  Opening creates the file when missing. WAL journaling is
  optional so the mirror can live on filesystems without shared
  memory support.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs one or more statements without results; throws on failure.
  void Exec(const std::string& sql);

  // Rows touched by the last INSERT/UPDATE/DELETE on this connection.
  int Changes() const;

 private:
  void ApplyPragmas(bool wal_mode);

  std::string path_;
  sqlite3*    db_ = nullptr;
};

} // namespace mirrorguard::db::sqlite
