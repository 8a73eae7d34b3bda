#include "single_file_storage.hpp"

#include <algorithm>

#include "internal/storage/common/file_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/ini/ini_serializer.hpp"
#include "internal/util/errors.hpp"

namespace mirrorguard::storage {

using namespace mirrorguard::storage::common;

SingleFileStorage::SingleFileStorage(std::string entity_name, std::filesystem::path file)
    : entity_name_(std::move(entity_name)), file_(std::move(file)) {
}

std::filesystem::path SingleFileStorage::GetEntityFilename(const std::string&, const std::optional<std::string>&) const {
  return file_;
}

std::vector<Entity> SingleFileStorage::LoadAll() const {
  if (!std::filesystem::is_regular_file(file_)) {
    return {};
  }
  return ini::IniSerializer::Deserialize(ReadFile(file_));
}

bool SingleFileStorage::Exists(const std::string& id, const std::optional<std::string>&) const {
  const auto entities = LoadAll();
  return std::any_of(entities.begin(), entities.end(), [&](const Entity& e) { return e.id == id; });
}

Entity SingleFileStorage::LoadEntity(const std::string& id, const std::optional<std::string>&) const {
  auto entities = LoadAll();
  auto it       = std::find_if(entities.begin(), entities.end(), [&](const Entity& e) { return e.id == id; });
  if (it == entities.end()) {
    throw util::NotFound(entity_name_ + " " + id + " not found");
  }
  return std::move(*it);
}

void SingleFileStorage::Save(const Entity& entity) {
  ValidateEntityId(entity.id);

  auto stored      = entity;
  stored.parent_id = std::nullopt;

  auto entities = LoadAll();
  auto it       = std::find_if(entities.begin(), entities.end(), [&](const Entity& e) { return e.id == entity.id; });
  if (it == entities.end()) {
    entities.push_back(std::move(stored));
  } else {
    *it = std::move(stored);
  }
  WriteAll(entities);
}

void SingleFileStorage::Delete(const std::string& id, const std::optional<std::string>&) {
  auto       entities = LoadAll();
  const auto before   = entities.size();
  entities.erase(std::remove_if(entities.begin(), entities.end(), [&](const Entity& e) { return e.id == id; }), entities.end());
  if (entities.size() != before) {
    WriteAll(entities);
  }
}

void SingleFileStorage::WriteAll(const std::vector<Entity>& entities) {
  WriteFileAtomically(file_, ini::IniSerializer::Serialize(entities));
}

} // namespace mirrorguard::storage
