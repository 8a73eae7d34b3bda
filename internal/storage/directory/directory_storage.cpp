#include "directory_storage.hpp"

#include <algorithm>

#include "internal/storage/common/file_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/ini/ini_serializer.hpp"
#include "internal/util/errors.hpp"

namespace mirrorguard::storage {

using namespace mirrorguard::storage::common;

namespace {

Entity ReadSingleEntity(const std::filesystem::path& path, const std::string& expected_id) {
  auto entities = ini::IniSerializer::Deserialize(ReadFile(path));
  if (entities.size() != 1 || entities.front().id != expected_id) {
    throw util::StorageError(path.string() + " does not hold exactly entity " + expected_id);
  }
  return std::move(entities.front());
}

void SortById(std::vector<Entity>& entities) {
  std::sort(entities.begin(), entities.end(), [](const Entity& a, const Entity& b) {
    if (a.parent_id != b.parent_id) {
      return a.parent_id < b.parent_id;
    }
    return a.id < b.id;
  });
}

} // namespace

// ------------------------------------------------------------------
// DirectoryStorage
// ------------------------------------------------------------------

DirectoryStorage::DirectoryStorage(std::string entity_name, std::filesystem::path dir)
    : entity_name_(std::move(entity_name)), dir_(std::move(dir)) {
}

std::filesystem::path DirectoryStorage::GetEntityFilename(const std::string& id, const std::optional<std::string>&) const {
  ValidateEntityId(id);
  return EntityFile(dir_ / id.substr(0, kShardLength), id);
}

bool DirectoryStorage::Exists(const std::string& id, const std::optional<std::string>& parent_id) const {
  return std::filesystem::is_regular_file(GetEntityFilename(id, parent_id));
}

Entity DirectoryStorage::LoadEntity(const std::string& id, const std::optional<std::string>& parent_id) const {
  const auto path = GetEntityFilename(id, parent_id);
  if (!std::filesystem::is_regular_file(path)) {
    throw util::NotFound(entity_name_ + " " + id + " not found");
  }
  return ReadSingleEntity(path, id);
}

std::vector<Entity> DirectoryStorage::LoadAll() const {
  std::vector<Entity> entities;
  if (!std::filesystem::is_directory(dir_)) {
    return entities;
  }

  for (const auto& shard : std::filesystem::directory_iterator(dir_)) {
    if (!shard.is_directory()) {
      continue;
    }
    for (const auto& file : std::filesystem::directory_iterator(shard.path())) {
      if (file.is_regular_file() && IsEntityFile(file.path())) {
        entities.push_back(ReadSingleEntity(file.path(), file.path().stem().string()));
      }
    }
  }

  SortById(entities);
  return entities;
}

void DirectoryStorage::Save(const Entity& entity) {
  Entity stored    = entity;
  stored.parent_id = std::nullopt;
  WriteFileAtomically(GetEntityFilename(entity.id, std::nullopt), ini::IniSerializer::Serialize(stored));
}

void DirectoryStorage::Delete(const std::string& id, const std::optional<std::string>& parent_id) {
  RemoveFileAndEmptyParents(GetEntityFilename(id, parent_id), dir_);
}

// ------------------------------------------------------------------
// ChildDirectoryStorage
// ------------------------------------------------------------------

ChildDirectoryStorage::ChildDirectoryStorage(std::string entity_name, std::filesystem::path dir)
    : entity_name_(std::move(entity_name)), dir_(std::move(dir)) {
}

std::optional<std::string> ChildDirectoryStorage::FindParent(const std::string& id) const {
  ValidateEntityId(id);
  if (!std::filesystem::is_directory(dir_)) {
    return std::nullopt;
  }

  std::vector<std::string> parents;
  for (const auto& parent : std::filesystem::directory_iterator(dir_)) {
    if (parent.is_directory() && std::filesystem::is_regular_file(EntityFile(parent.path(), id))) {
      parents.push_back(parent.path().filename().string());
    }
  }
  if (parents.empty()) {
    return std::nullopt;
  }
  std::sort(parents.begin(), parents.end());
  return parents.front();
}

std::filesystem::path ChildDirectoryStorage::GetEntityFilename(const std::string& id, const std::optional<std::string>& parent_id) const {
  if (!parent_id) {
    throw util::InvalidState(entity_name_ + " entities are scoped by a parent id");
  }
  ValidateEntityId(*parent_id);
  return EntityFile(dir_ / *parent_id, id);
}

bool ChildDirectoryStorage::Exists(const std::string& id, const std::optional<std::string>& parent_id) const {
  if (!parent_id) {
    return FindParent(id).has_value();
  }
  return std::filesystem::is_regular_file(GetEntityFilename(id, parent_id));
}

Entity ChildDirectoryStorage::LoadEntity(const std::string& id, const std::optional<std::string>& parent_id) const {
  const auto parent = parent_id ? parent_id : FindParent(id);
  if (!parent || !std::filesystem::is_regular_file(GetEntityFilename(id, parent))) {
    throw util::NotFound(entity_name_ + " " + id + " not found");
  }

  auto entity      = ReadSingleEntity(GetEntityFilename(id, parent), id);
  entity.parent_id = parent;
  return entity;
}

std::vector<Entity> ChildDirectoryStorage::LoadAll() const {
  std::vector<Entity> entities;
  if (!std::filesystem::is_directory(dir_)) {
    return entities;
  }

  for (const auto& parent : std::filesystem::directory_iterator(dir_)) {
    if (!parent.is_directory()) {
      continue;
    }
    const auto parent_id = parent.path().filename().string();
    for (const auto& file : std::filesystem::directory_iterator(parent.path())) {
      if (file.is_regular_file() && IsEntityFile(file.path())) {
        auto entity      = ReadSingleEntity(file.path(), file.path().stem().string());
        entity.parent_id = parent_id;
        entities.push_back(std::move(entity));
      }
    }
  }

  SortById(entities);
  return entities;
}

void ChildDirectoryStorage::Save(const Entity& entity) {
  Entity stored    = entity;
  stored.parent_id = std::nullopt;
  WriteFileAtomically(GetEntityFilename(entity.id, entity.parent_id), ini::IniSerializer::Serialize(stored));
}

void ChildDirectoryStorage::Delete(const std::string& id, const std::optional<std::string>& parent_id) {
  const auto parent = parent_id ? parent_id : FindParent(id);
  if (!parent) {
    return;
  }
  RemoveFileAndEmptyParents(GetEntityFilename(id, parent), dir_);
}

} // namespace mirrorguard::storage
