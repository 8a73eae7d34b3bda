#pragma once

#include <memory>

#include "internal/db/api/mirror_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace mirrorguard::db::sqlite {

class SqliteRepository final : public db::MirrorRepository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates the mirror tables when missing.
  static void Bootstrap(SqliteDB& db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertEntity(Transaction&, const model::EntityRow&) override;
  Result DeleteEntity(Transaction&, const std::string& entity_name, const std::string& vp_id) override;
  std::optional<model::EntityRow> GetEntity(Transaction&, const std::string& entity_name, const std::string& vp_id) override;
  std::vector<model::EntityRow> ListEntities(Transaction&, const std::string& entity_name) override;
  Result TouchPost(Transaction&, const std::string& vp_id, const std::string& modified, const std::string& modified_gmt) override;

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace mirrorguard::db::sqlite
