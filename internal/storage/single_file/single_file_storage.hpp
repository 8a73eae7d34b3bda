#pragma once

#include <filesystem>
#include <string>

#include "internal/storage/storage.hpp"

namespace mirrorguard::storage {

/*
  All entities of a type in one INI file (users.ini, terms.ini,
  options.ini), one section per entity. Every write rewrites the
  whole file; these collections are small.
*/
class SingleFileStorage final : public Storage {
 public:
  SingleFileStorage(std::string entity_name, std::filesystem::path file);

  bool                  Exists(const std::string& id, const std::optional<std::string>& parent_id) const override;
  Entity                LoadEntity(const std::string& id, const std::optional<std::string>& parent_id) const override;
  std::vector<Entity>   LoadAll() const override;
  void                  Save(const Entity& entity) override;
  void                  Delete(const std::string& id, const std::optional<std::string>& parent_id) override;
  std::filesystem::path GetEntityFilename(const std::string& id, const std::optional<std::string>& parent_id) const override;

 private:
  void WriteAll(const std::vector<Entity>& entities);

  std::string           entity_name_;
  std::filesystem::path file_;
};

} // namespace mirrorguard::storage
