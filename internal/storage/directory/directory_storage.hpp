#pragma once

#include <filesystem>
#include <string>

#include "internal/storage/storage.hpp"

namespace mirrorguard::storage {

/*
  One file per entity, sharded by the first characters of the id:

      <dir>/ab/abcd1234.ini

  Used for large top-level collections (posts, comments).
  Parent scope is ignored.
*/
class DirectoryStorage final : public Storage {
 public:
  static constexpr std::size_t kShardLength = 2;

  DirectoryStorage(std::string entity_name, std::filesystem::path dir);

  bool                  Exists(const std::string& id, const std::optional<std::string>& parent_id) const override;
  Entity                LoadEntity(const std::string& id, const std::optional<std::string>& parent_id) const override;
  std::vector<Entity>   LoadAll() const override;
  void                  Save(const Entity& entity) override;
  void                  Delete(const std::string& id, const std::optional<std::string>& parent_id) override;
  std::filesystem::path GetEntityFilename(const std::string& id, const std::optional<std::string>& parent_id) const override;

 private:
  std::string           entity_name_;
  std::filesystem::path dir_;
};

/*
  Child entities grouped by their parent's id:

      <dir>/<parent-id>/<id>.ini

  Lookups with a parent only look inside that parent's directory.
*/
class ChildDirectoryStorage final : public Storage {
 public:
  ChildDirectoryStorage(std::string entity_name, std::filesystem::path dir);

  bool                  Exists(const std::string& id, const std::optional<std::string>& parent_id) const override;
  Entity                LoadEntity(const std::string& id, const std::optional<std::string>& parent_id) const override;
  std::vector<Entity>   LoadAll() const override;
  void                  Save(const Entity& entity) override;
  void                  Delete(const std::string& id, const std::optional<std::string>& parent_id) override;
  std::filesystem::path GetEntityFilename(const std::string& id, const std::optional<std::string>& parent_id) const override;

 private:
  // Resolves the parent when the caller did not scope the lookup.
  std::optional<std::string> FindParent(const std::string& id) const;

  std::string           entity_name_;
  std::filesystem::path dir_;
};

} // namespace mirrorguard::storage
