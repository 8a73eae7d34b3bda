#include "reference_lookup.hpp"

#include <algorithm>
#include <vector>

#include "internal/observability/logging.hpp"

namespace mirrorguard::revert {

namespace {

struct ReferencingField {
  std::string field;
  bool        many = false;
};

// Fields of `info` that point at target_entity.
std::vector<ReferencingField> FieldsReferencing(const schema::EntityInfo& info, const std::string& target_entity) {
  std::vector<ReferencingField> fields;
  for (const auto& [reference, target] : info.references) {
    if (target == target_entity) {
      fields.push_back({schema::EntityInfo::ReferenceField(reference), false});
    }
  }
  for (const auto& [reference, target] : info.mn_references) {
    if (target == target_entity) {
      fields.push_back({schema::EntityInfo::MnReferenceField(target), true});
    }
  }
  return fields;
}

bool Holds(const storage::Entity& entity, const ReferencingField& ref, const std::string& entity_id) {
  if (!ref.many) {
    const auto* value = entity.GetString(ref.field);
    return value && *value == entity_id;
  }
  const auto* values = entity.GetList(ref.field);
  return values && std::find(values->begin(), values->end(), entity_id) != values->end();
}

} // namespace

ScanningReferenceLookup::ScanningReferenceLookup(std::shared_ptr<const schema::DbSchemaInfo> schema,
                                                 std::shared_ptr<storage::StorageFactory>    storages)
    : schema_(std::move(schema)), storages_(std::move(storages)) {
}

bool ScanningReferenceLookup::ExistsSomeEntityWithReferenceTo(const std::string& entity_name, const std::string& entity_id) const {
  for (const auto& other_name : schema_->GetAllEntityNames()) {
    const auto fields = FieldsReferencing(schema_->GetEntityInfo(other_name), entity_name);
    if (fields.empty()) {
      continue;
    }

    for (const auto& candidate : storages_->GetStorage(other_name)->LoadAll()) {
      for (const auto& ref : fields) {
        if (Holds(candidate, ref, entity_id)) {
          MIRRORGUARD_LOG_INFO("entity is still referenced",
                               {observability::StringField("entity", entity_name), observability::StringField("id", entity_id),
                                observability::StringField("referenced_by", other_name), observability::StringField("referencing_id", candidate.id),
                                observability::StringField("field", ref.field)});
          return true;
        }
      }
    }
  }
  return false;
}

} // namespace mirrorguard::revert
