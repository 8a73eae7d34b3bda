#include "db_schema_info.hpp"

#include <yaml-cpp/yaml.h>

#include "internal/util/errors.hpp"

namespace mirrorguard::schema {

namespace {

std::map<std::string, std::string> ReadReferenceMap(const YAML::Node& node, const std::string& entity_name, const char* key) {
  std::map<std::string, std::string> references;
  const auto                         section = node[key];
  if (!section) {
    return references;
  }
  if (!section.IsMap()) {
    throw util::SchemaError(entity_name + "." + key + " must be a map");
  }
  for (const auto& entry : section) {
    references.emplace(entry.first.as<std::string>(), entry.second.as<std::string>());
  }
  return references;
}

} // namespace

DbSchemaInfo::DbSchemaInfo(std::vector<EntityInfo> entities) {
  for (auto& info : entities) {
    if (entities_.contains(info.entity_name)) {
      throw util::SchemaError("duplicate entity: " + info.entity_name);
    }
    names_.push_back(info.entity_name);
    entities_.emplace(info.entity_name, std::move(info));
  }
  Validate();
}

DbSchemaInfo DbSchemaInfo::LoadFromYaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::SchemaError("Failed to load schema " + path + ": " + e.what());
  }
  return FromNode(root);
}

DbSchemaInfo DbSchemaInfo::LoadFromYamlString(const std::string& yaml) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const std::exception& e) {
    throw util::SchemaError(std::string("Failed to parse schema: ") + e.what());
  }
  return FromNode(root);
}

DbSchemaInfo DbSchemaInfo::FromNode(const YAML::Node& root) {
  if (!root.IsMap()) {
    throw util::SchemaError("schema root must be a map of entity names");
  }

  std::vector<EntityInfo> entities;
  try {
    for (const auto& entry : root) {
      EntityInfo info;
      info.entity_name = entry.first.as<std::string>();

      const auto& body = entry.second;
      if (body && !body.IsNull()) {
        if (!body.IsMap()) {
          throw util::SchemaError(info.entity_name + " must be a map");
        }
        if (body["id"]) {
          info.id_column = body["id"].as<std::string>();
        }
        info.references    = ReadReferenceMap(body, info.entity_name, "references");
        info.mn_references = ReadReferenceMap(body, info.entity_name, "mn-references");
        if (body["parent-reference"]) {
          info.parent_reference = body["parent-reference"].as<std::string>();
        }
      }
      entities.push_back(std::move(info));
    }
  } catch (const YAML::Exception& e) {
    throw util::SchemaError(std::string("Malformed schema: ") + e.what());
  }

  return DbSchemaInfo(std::move(entities));
}

void DbSchemaInfo::Validate() const {
  for (const auto& name : names_) {
    const auto& info = entities_.at(name);
    for (const auto* references : {&info.references, &info.mn_references}) {
      for (const auto& [reference, target] : *references) {
        if (!entities_.contains(target)) {
          throw util::SchemaError(name + "." + reference + " references unknown entity " + target);
        }
      }
    }
    if (info.parent_reference && !info.references.contains(*info.parent_reference)) {
      throw util::SchemaError(name + " parent-reference " + *info.parent_reference + " is not a declared reference");
    }
  }
}

const EntityInfo& DbSchemaInfo::GetEntityInfo(const std::string& entity_name) const {
  auto it = entities_.find(entity_name);
  if (it == entities_.end()) {
    throw util::NotFound("unknown entity: " + entity_name);
  }
  return it->second;
}

bool DbSchemaInfo::HasEntity(const std::string& entity_name) const {
  return entities_.contains(entity_name);
}

} // namespace mirrorguard::schema
