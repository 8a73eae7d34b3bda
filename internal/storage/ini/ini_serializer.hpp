#pragma once

#include <string>
#include <vector>

#include "internal/storage/entity.hpp"

namespace mirrorguard::storage::ini {

/*
  INI persistence of entities.

    [<id>]
    title = "Hello \"world\""
    vp_term_taxonomy[] = "a1"
    vp_term_taxonomy[] = "b2"

  Sections keep their order; fields are written sorted by name so
  the files diff cleanly. parent_id is never written, the storage
  layout carries it.
*/
class IniSerializer {
 public:
  static std::string Serialize(const std::vector<Entity>& entities);
  static std::string Serialize(const Entity& entity);

  // Throws util::StorageError on malformed input.
  static std::vector<Entity> Deserialize(const std::string& text);

  static std::string EscapeValue(const std::string& value);
};

} // namespace mirrorguard::storage::ini
