#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/entity_row.hpp"

namespace mirrorguard::db {

/*
  Relational mirror of the file store.

  GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - UpsertEntity never touches modified / modified_gmt of an
    existing row

  The file store is the source of truth; this mirror is rebuilt
  from it by synchronization.
*/
class MirrorRepository {
 public:
  static constexpr const char* kPostEntity = "post";

  virtual ~MirrorRepository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual Result UpsertEntity(Transaction&, const model::EntityRow&) = 0;

  virtual Result DeleteEntity(Transaction&, const std::string& entity_name, const std::string& vp_id) = 0;

  virtual std::optional<model::EntityRow> GetEntity(Transaction&, const std::string& entity_name, const std::string& vp_id) = 0;

  // Ordered by vp_id.
  virtual std::vector<model::EntityRow> ListEntities(Transaction&, const std::string& entity_name) = 0;

  // NotFound when no post with this vp_id is mirrored.
  virtual Result TouchPost(Transaction&, const std::string& vp_id, const std::string& modified, const std::string& modified_gmt) = 0;
};

using MirrorRepositoryPtr = std::shared_ptr<MirrorRepository>;

// Converts a failed Result into the matching util exception.
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace mirrorguard::db
