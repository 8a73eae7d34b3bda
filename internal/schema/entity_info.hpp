#pragma once

#include <map>
#include <optional>
#include <string>

namespace mirrorguard::schema {

/*
  Reference metadata for one entity type.

  references:    reference name -> target entity (1:N, field "vp_<name>")
  mn_references: reference name -> target entity (M:N, field "vp_<target>")
*/
struct EntityInfo {
  std::string                        entity_name;
  std::string                        id_column = "id";
  std::map<std::string, std::string> references;
  std::map<std::string, std::string> mn_references;
  std::optional<std::string>         parent_reference;

  static constexpr const char* kReferencePrefix = "vp_";

  static std::string ReferenceField(const std::string& reference) {
    return kReferencePrefix + reference;
  }

  static std::string MnReferenceField(const std::string& target_entity) {
    return kReferencePrefix + target_entity;
  }
};

} // namespace mirrorguard::schema
