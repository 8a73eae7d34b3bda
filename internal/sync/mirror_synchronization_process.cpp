#include "mirror_synchronization_process.hpp"

#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/ini/ini_serializer.hpp"

namespace mirrorguard::sync {

MirrorSynchronizationProcess::MirrorSynchronizationProcess(std::shared_ptr<storage::StorageFactory>    storages,
                                                           std::shared_ptr<const schema::DbSchemaInfo> schema, db::MirrorRepositoryPtr mirror)
    : storages_(std::move(storages)), schema_(std::move(schema)), mirror_(std::move(mirror)) {
}

void MirrorSynchronizationProcess::Synchronize(const std::vector<std::string>& entity_names) {
  observability::SpanScope span("mirrorguard.synchronize");

  std::unordered_set<std::string> seen;
  for (const auto& name : entity_names) {
    if (!seen.insert(name).second) {
      continue;
    }

    if (!schema_->HasEntity(name) || !storages_->HasStorage(name)) {
      MIRRORGUARD_LOG_WARN("skipping synchronization of unknown entity", {observability::StringField("entity", name)});
      continue;
    }

    SynchronizeEntity(name);
  }

  span.SetAttribute("entity_types", static_cast<std::int64_t>(seen.size()));
}

void MirrorSynchronizationProcess::SynchronizeEntity(const std::string& entity_name) {
  const auto entities = storages_->GetStorage(entity_name)->LoadAll();

  auto tx = mirror_->Begin();

  std::unordered_set<std::string> stored_ids;
  for (const auto& entity : entities) {
    stored_ids.insert(entity.id);

    db::model::EntityRow row;
    row.entity_name  = entity_name;
    row.vp_id        = entity.id;
    row.parent_vp_id = entity.parent_id;
    row.body         = storage::ini::IniSerializer::Serialize(entity);

    db::ThrowIfDbError(mirror_->UpsertEntity(*tx, row), "upsert " + entity_name + " " + entity.id);
  }

  std::int64_t deleted = 0;
  for (const auto& row : mirror_->ListEntities(*tx, entity_name)) {
    if (stored_ids.contains(row.vp_id)) {
      continue;
    }
    db::ThrowIfDbError(mirror_->DeleteEntity(*tx, entity_name, row.vp_id), "delete " + entity_name + " " + row.vp_id);
    ++deleted;
  }

  tx->Commit();

  MIRRORGUARD_LOG_INFO("synchronized entity type", {observability::StringField("entity", entity_name),
                                                    observability::IntField("upserted", static_cast<std::int64_t>(entities.size())),
                                                    observability::IntField("deleted", deleted)});
}

} // namespace mirrorguard::sync
