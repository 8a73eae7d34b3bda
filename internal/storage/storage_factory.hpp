#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "config/config.pb.h"
#include "storage.hpp"

namespace mirrorguard::storage {

/*
  Maps entity names to their storages.

  Core uses this as:

      auto storages = StorageFactory::Build(config.storage());
      storages->GetStorage("post")->Exists(id, std::nullopt);
*/
class StorageFactory {
 public:
  static constexpr const char* kDirectoryKind      = "directory";
  static constexpr const char* kSingleFileKind     = "single_file";
  static constexpr const char* kChildDirectoryKind = "child_directory";

  static std::shared_ptr<StorageFactory> Build(const mirrorguard::runtime::config::StorageConfig& cfg);

  void Register(const std::string& entity_name, StoragePtr storage);

  // Throws util::NotFound for entities without a storage.
  StoragePtr GetStorage(const std::string& entity_name) const;

  bool HasStorage(const std::string& entity_name) const;

 private:
  std::unordered_map<std::string, StoragePtr> storages_;
};

} // namespace mirrorguard::storage
