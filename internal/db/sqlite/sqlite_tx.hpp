#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace mirrorguard::db::sqlite {

/*
  One synchronization or stamping pass over the mirror file.

  BEGIN IMMEDIATE takes the write lock up front, so two mirrorguard
  runs serialize instead of failing half way with SQLITE_BUSY.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  SqliteDB& Database() const {
    return *db_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override {
    return finished_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      finished_ = false;
};

} // namespace mirrorguard::db::sqlite
