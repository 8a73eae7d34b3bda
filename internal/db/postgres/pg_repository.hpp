#pragma once

#include "internal/db/api/mirror_repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace mirrorguard::db::postgres {

class PgRepository final : public db::MirrorRepository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  // Creates the mirror tables when missing.
  static void Bootstrap(const std::string& conninfo);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertEntity(Transaction&, const model::EntityRow&) override;
  Result DeleteEntity(Transaction&, const std::string& entity_name, const std::string& vp_id) override;
  std::optional<model::EntityRow> GetEntity(Transaction&, const std::string& entity_name, const std::string& vp_id) override;
  std::vector<model::EntityRow> ListEntities(Transaction&, const std::string& entity_name) override;
  Result TouchPost(Transaction&, const std::string& vp_id, const std::string& modified, const std::string& modified_gmt) override;

 private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace mirrorguard::db::postgres
