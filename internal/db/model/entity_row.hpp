#pragma once

#include <optional>
#include <string>

namespace mirrorguard::db::model {

/*
  One mirrored entity.

  body is the entity serialized the same way the file store keeps
  it. modified / modified_gmt are stamped by reverts (posts only)
  and survive re-synchronization.
*/
struct EntityRow {
  std::string                entity_name;
  std::string                vp_id;
  std::optional<std::string> parent_vp_id;
  std::string                body;
  std::optional<std::string> modified;
  std::optional<std::string> modified_gmt;
};

} // namespace mirrorguard::db::model
