#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/revert/reference_lookup.hpp"
#include "internal/schema/db_schema_info.hpp"
#include "internal/storage/storage_factory.hpp"

namespace mirrorguard::revert {

/*
  Referential integrity of one changed entity, evaluated against
  the current (post-revert) file store.

  - entity gone:   nothing may still reference it
  - entity exists: every set 1:N / M:N reference must resolve,
                   looked up in the entity's own parent scope

  An absent reference field means "not set" and always passes.
  Read-only; the result depends only on store contents.
*/
class ReferenceChecker {
 public:
  ReferenceChecker(std::shared_ptr<const schema::DbSchemaInfo> schema, std::shared_ptr<storage::StorageFactory> storages,
                   ReferenceLookupPtr lookup);

  bool CheckEntityReferences(const std::string& entity_name, const std::string& entity_id, const std::optional<std::string>& parent_id) const;

 private:
  bool ReferenceExists(const std::string& target_entity, const std::string& target_id, const std::optional<std::string>& parent_id) const;

  std::shared_ptr<const schema::DbSchemaInfo> schema_;
  std::shared_ptr<storage::StorageFactory>    storages_;
  ReferenceLookupPtr                          lookup_;
};

} // namespace mirrorguard::revert
