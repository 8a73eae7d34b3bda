#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "internal/db/api/mirror_repository.hpp"

namespace mirrorguard::db::memory {

class MemoryTransaction;

/*
  In-process mirror used by tests and when no database is
  configured. Transactions work on a snapshot copy.
*/
class MemoryRepository final : public db::MirrorRepository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertEntity(Transaction&, const model::EntityRow&) override;
  Result DeleteEntity(Transaction&, const std::string& entity_name, const std::string& vp_id) override;
  std::optional<model::EntityRow> GetEntity(Transaction&, const std::string& entity_name, const std::string& vp_id) override;
  std::vector<model::EntityRow> ListEntities(Transaction&, const std::string& entity_name) override;
  Result TouchPost(Transaction&, const std::string& vp_id, const std::string& modified, const std::string& modified_gmt) override;

 private:
  friend class MemoryTransaction;

  using Key = std::pair<std::string, std::string>; // entity_name, vp_id

  struct State {
    std::map<Key, model::EntityRow> rows;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace mirrorguard::db::memory
