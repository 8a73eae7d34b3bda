#include "reference_checker.hpp"

#include "internal/observability/logging.hpp"

namespace mirrorguard::revert {

namespace {

void LogViolation(const std::string& entity_name, const std::string& entity_id, const std::string& field, const std::string& missing_id) {
  MIRRORGUARD_LOG_INFO("reference points to a missing entity",
                       {observability::StringField("entity", entity_name), observability::StringField("id", entity_id),
                        observability::StringField("field", field), observability::StringField("missing_id", missing_id)});
}

} // namespace

ReferenceChecker::ReferenceChecker(std::shared_ptr<const schema::DbSchemaInfo> schema, std::shared_ptr<storage::StorageFactory> storages,
                                   ReferenceLookupPtr lookup)
    : schema_(std::move(schema)), storages_(std::move(storages)), lookup_(std::move(lookup)) {
}

bool ReferenceChecker::CheckEntityReferences(const std::string& entity_name, const std::string& entity_id,
                                             const std::optional<std::string>& parent_id) const {
  const auto& info    = schema_->GetEntityInfo(entity_name);
  auto        storage = storages_->GetStorage(entity_name);

  if (!storage->Exists(entity_id, parent_id)) {
    return !lookup_->ExistsSomeEntityWithReferenceTo(entity_name, entity_id);
  }

  const auto entity = storage->LoadEntity(entity_id, parent_id);

  for (const auto& [reference, target] : info.references) {
    const auto  field = schema::EntityInfo::ReferenceField(reference);
    const auto* value = entity.GetString(field);
    if (!value) {
      continue;
    }
    if (!ReferenceExists(target, *value, parent_id)) {
      LogViolation(entity_name, entity_id, field, *value);
      return false;
    }
  }

  for (const auto& [reference, target] : info.mn_references) {
    const auto  field  = schema::EntityInfo::MnReferenceField(target);
    const auto* values = entity.GetList(field);
    if (!values) {
      continue;
    }
    for (const auto& referenced_id : *values) {
      if (!ReferenceExists(target, referenced_id, parent_id)) {
        LogViolation(entity_name, entity_id, field, referenced_id);
        return false;
      }
    }
  }

  return true;
}

bool ReferenceChecker::ReferenceExists(const std::string& target_entity, const std::string& target_id,
                                       const std::optional<std::string>& parent_id) const {
  return storages_->GetStorage(target_entity)->Exists(target_id, parent_id);
}

} // namespace mirrorguard::revert
