#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace mirrorguard::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::UpsertEntity(Transaction& t, const model::EntityRow& r) {
  auto& rows = TX(t).Mutable().rows;
  auto  it   = rows.find({r.entity_name, r.vp_id});
  if (it == rows.end()) {
    rows.emplace(Key{r.entity_name, r.vp_id}, r);
    return Result::Ok();
  }

  it->second.parent_vp_id = r.parent_vp_id;
  it->second.body         = r.body;
  return Result::Ok();
}

Result MemoryRepository::DeleteEntity(Transaction& t, const std::string& entity_name, const std::string& vp_id) {
  TX(t).Mutable().rows.erase({entity_name, vp_id});
  return Result::Ok();
}

std::optional<model::EntityRow> MemoryRepository::GetEntity(Transaction& t, const std::string& entity_name, const std::string& vp_id) {
  const auto& rows = TX(t).Mutable().rows;
  auto        it   = rows.find({entity_name, vp_id});
  if (it == rows.end()) return std::nullopt;
  return it->second;
}

std::vector<model::EntityRow> MemoryRepository::ListEntities(Transaction& t, const std::string& entity_name) {
  std::vector<model::EntityRow> rows;
  for (const auto& [key, row] : TX(t).Mutable().rows) {
    if (key.first == entity_name) {
      rows.push_back(row);
    }
  }
  return rows;
}

Result MemoryRepository::TouchPost(Transaction& t, const std::string& vp_id, const std::string& modified, const std::string& modified_gmt) {
  auto& rows = TX(t).Mutable().rows;
  auto  it   = rows.find({kPostEntity, vp_id});
  if (it == rows.end()) {
    return Result::Err(ErrorCode::NotFound, "post " + vp_id + " is not mirrored");
  }
  it->second.modified     = modified;
  it->second.modified_gmt = modified_gmt;
  return Result::Ok();
}

} // namespace mirrorguard::db::memory
