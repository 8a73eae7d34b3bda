#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "internal/schema/entity_info.hpp"

namespace YAML {
class Node;
}

namespace mirrorguard::schema {

/*
  Registry of entity types and the references between them.

  Loaded once from a YAML document of the form

    post:
      id: ID
      references:
        post_author: user
      mn-references:
        term_relationships: term_taxonomy
    postmeta:
      parent-reference: post_id
      references:
        post_id: post

  and immutable afterwards.
*/
class DbSchemaInfo {
 public:
  explicit DbSchemaInfo(std::vector<EntityInfo> entities);

  static DbSchemaInfo LoadFromYaml(const std::string& path);
  static DbSchemaInfo LoadFromYamlString(const std::string& yaml);

  const EntityInfo& GetEntityInfo(const std::string& entity_name) const;

  bool HasEntity(const std::string& entity_name) const;

  // Declaration order.
  const std::vector<std::string>& GetAllEntityNames() const {
    return names_;
  }

 private:
  static DbSchemaInfo FromNode(const YAML::Node& root);

  void Validate() const;

  std::vector<std::string>                    names_;
  std::unordered_map<std::string, EntityInfo> entities_;
};

} // namespace mirrorguard::schema
