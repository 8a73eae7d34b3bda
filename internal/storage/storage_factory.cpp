#include "storage_factory.hpp"

#include <filesystem>

#include "directory/directory_storage.hpp"
#include "internal/util/errors.hpp"
#include "single_file/single_file_storage.hpp"

namespace mirrorguard::storage {

std::shared_ptr<StorageFactory> StorageFactory::Build(const mirrorguard::runtime::config::StorageConfig& cfg) {
  auto factory = std::make_shared<StorageFactory>();

  const std::filesystem::path root = cfg.root_path().empty() ? std::filesystem::path{"."} : std::filesystem::path{cfg.root_path()};

  for (const auto& entity : cfg.entities()) {
    if (entity.entity().empty() || entity.path().empty()) {
      throw util::ConfigError("storage entries need both entity and path");
    }

    const auto path = root / entity.path();
    if (entity.kind().empty() || entity.kind() == kDirectoryKind) {
      factory->Register(entity.entity(), std::make_shared<DirectoryStorage>(entity.entity(), path));
    } else if (entity.kind() == kSingleFileKind) {
      factory->Register(entity.entity(), std::make_shared<SingleFileStorage>(entity.entity(), path));
    } else if (entity.kind() == kChildDirectoryKind) {
      factory->Register(entity.entity(), std::make_shared<ChildDirectoryStorage>(entity.entity(), path));
    } else {
      throw util::ConfigError("unknown storage kind '" + entity.kind() + "' for " + entity.entity());
    }
  }

  return factory;
}

void StorageFactory::Register(const std::string& entity_name, StoragePtr storage) {
  if (!storages_.emplace(entity_name, std::move(storage)).second) {
    throw util::ConfigError("storage registered twice for " + entity_name);
  }
}

StoragePtr StorageFactory::GetStorage(const std::string& entity_name) const {
  auto it = storages_.find(entity_name);
  if (it == storages_.end()) {
    throw util::NotFound("no storage for entity " + entity_name);
  }
  return it->second;
}

bool StorageFactory::HasStorage(const std::string& entity_name) const {
  return storages_.contains(entity_name);
}

} // namespace mirrorguard::storage
