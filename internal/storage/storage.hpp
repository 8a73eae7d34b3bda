#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/storage/entity.hpp"

namespace mirrorguard::storage {

/*
  File-backed storage of one entity type.

  The version-control backend owns the files; a storage only reads
  and writes them inside the work tree. parent_id scopes child
  entities; storages of top-level entities ignore it.

  Implementations:
    DirectoryStorage      -> <dir>/<id[0..2]>/<id>.ini
    SingleFileStorage     -> one .ini, one section per entity
    ChildDirectoryStorage -> <dir>/<parent>/<id>.ini
*/
class Storage {
 public:
  virtual ~Storage() = default;

  virtual bool Exists(const std::string& id, const std::optional<std::string>& parent_id) const = 0;

  // Throws util::NotFound when the entity does not exist.
  virtual Entity LoadEntity(const std::string& id, const std::optional<std::string>& parent_id) const = 0;

  virtual std::vector<Entity> LoadAll() const = 0;

  virtual void Save(const Entity& entity) = 0;

  // Deleting a missing entity is a no-op.
  virtual void Delete(const std::string& id, const std::optional<std::string>& parent_id) = 0;

  virtual std::filesystem::path GetEntityFilename(const std::string& id, const std::optional<std::string>& parent_id) const = 0;
};

using StoragePtr = std::shared_ptr<Storage>;

} // namespace mirrorguard::storage
