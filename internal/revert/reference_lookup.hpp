#pragma once

#include <memory>
#include <string>

#include "internal/schema/db_schema_info.hpp"
#include "internal/storage/storage_factory.hpp"

namespace mirrorguard::revert {

/*
  Answers "does any stored entity still point at <entity>/<id>?".

  There is no reverse-reference index in the file store; an indexed
  implementation can replace the scanning one without touching the
  checker.
*/
class ReferenceLookup {
 public:
  virtual ~ReferenceLookup() = default;

  virtual bool ExistsSomeEntityWithReferenceTo(const std::string& entity_name, const std::string& entity_id) const = 0;
};

using ReferenceLookupPtr = std::shared_ptr<const ReferenceLookup>;

/*
  Full scan: for every entity type declaring a 1:N or M:N reference
  to entity_name, loads all of its entities and compares the
  reference fields. O(types x entities).
*/
class ScanningReferenceLookup final : public ReferenceLookup {
 public:
  ScanningReferenceLookup(std::shared_ptr<const schema::DbSchemaInfo> schema, std::shared_ptr<storage::StorageFactory> storages);

  bool ExistsSomeEntityWithReferenceTo(const std::string& entity_name, const std::string& entity_id) const override;

 private:
  std::shared_ptr<const schema::DbSchemaInfo> schema_;
  std::shared_ptr<storage::StorageFactory>    storages_;
};

} // namespace mirrorguard::revert
