#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"

namespace mirrorguard::storage::common {

inline constexpr const char* kEntityFileExtension = ".ini";

// Ids end up as path components, so they must not be able to escape the store.
inline void ValidateEntityId(const std::string& entity_id) {
  if (entity_id.empty()) {
    throw util::StorageError("entity id must not be empty");
  }
  for (char c : entity_id) {
    if (c == '/' || c == '\\' || c == '\0' || c == '[' || c == ']') {
      throw util::StorageError("entity id contains invalid character: " + entity_id);
    }
  }
  if (entity_id == "." || entity_id == "..") {
    throw util::StorageError("entity id must not be a relative path component");
  }
}

inline std::filesystem::path EntityFile(const std::filesystem::path& dir, const std::string& entity_id) {
  ValidateEntityId(entity_id);
  return dir / (entity_id + kEntityFileExtension);
}

inline bool IsEntityFile(const std::filesystem::path& path) {
  return path.extension() == kEntityFileExtension;
}

} // namespace mirrorguard::storage::common
