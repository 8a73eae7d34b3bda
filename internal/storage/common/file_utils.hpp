#pragma once

#include <filesystem>
#include <string>

namespace mirrorguard::storage::common {

std::string ReadFile(const std::filesystem::path& path);

/*
  Atomic write:
      write tmp -> flush -> rename
*/
void WriteFileAtomically(const std::filesystem::path& path, const std::string& contents);

// Removes path and then every parent directory up to (excluding) stop_at that became empty.
void RemoveFileAndEmptyParents(const std::filesystem::path& path, const std::filesystem::path& stop_at);

} // namespace mirrorguard::storage::common
