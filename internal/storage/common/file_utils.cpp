#include "file_utils.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include "internal/util/errors.hpp"

namespace mirrorguard::storage::common {

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::StorageError("cannot open " + path.string());
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

void WriteFileAtomically(const std::filesystem::path& path, const std::string& contents) {
  std::filesystem::create_directories(path.parent_path());

  const auto tmp_path = std::filesystem::path(path.string() + ".tmp");
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw util::StorageError("cannot write " + tmp_path.string());
    }
    out << contents;
    out.flush();
    if (!out) {
      throw util::StorageError("short write to " + tmp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::filesystem::remove(tmp_path);
    throw util::StorageError("cannot replace " + path.string() + ": " + ec.message());
  }
}

void RemoveFileAndEmptyParents(const std::filesystem::path& path, const std::filesystem::path& stop_at) {
  std::filesystem::remove(path);

  auto dir = path.parent_path();
  while (!dir.empty() && dir != stop_at && std::filesystem::is_directory(dir) && std::filesystem::is_empty(dir)) {
    std::filesystem::remove(dir);
    dir = dir.parent_path();
  }
}

} // namespace mirrorguard::storage::common
