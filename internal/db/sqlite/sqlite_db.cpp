#include "sqlite_db.hpp"

#include <stdexcept>

namespace mirrorguard::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const std::string reason = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open mirror database " + path_ + ": " + reason);
  }

  try {
    ApplyPragmas(wal_mode);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    const std::string reason = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw std::runtime_error(path_ + ": " + reason);
  }
}

int SqliteDB::Changes() const {
  return sqlite3_changes(db_);
}

void SqliteDB::ApplyPragmas(bool wal_mode) {
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL; PRAGMA synchronous=NORMAL;");
  }
  Exec("PRAGMA foreign_keys=ON;");

  // a concurrent synchronizer may hold the write lock briefly
  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    throw std::runtime_error(path_ + ": cannot set busy timeout");
  }
}

} // namespace mirrorguard::db::sqlite
