#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/mirror_repository.hpp"
#include "internal/schema/db_schema_info.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/sync/synchronization_process.hpp"

namespace mirrorguard::sync {

/*
  Rebuilds mirror rows from the file store, one transaction per
  entity type:

    - every stored entity is upserted (body = INI text)
    - rows without a stored entity are deleted

  Stored modification stamps survive the upsert.
*/
class MirrorSynchronizationProcess final : public SynchronizationProcess {
 public:
  MirrorSynchronizationProcess(std::shared_ptr<storage::StorageFactory> storages, std::shared_ptr<const schema::DbSchemaInfo> schema,
                               db::MirrorRepositoryPtr mirror);

  void Synchronize(const std::vector<std::string>& entity_names) override;

 private:
  void SynchronizeEntity(const std::string& entity_name);

  std::shared_ptr<storage::StorageFactory>   storages_;
  std::shared_ptr<const schema::DbSchemaInfo> schema_;
  db::MirrorRepositoryPtr                    mirror_;
};

} // namespace mirrorguard::sync
