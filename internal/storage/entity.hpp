#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mirrorguard::storage {

// A field holds either a single value or an (ordered) list of values.
using FieldValue = std::variant<std::string, std::vector<std::string>>;

/*
  One entity as materialized from the file store.

  parent_id is set only for entities scoped under a parent
  (e.g. meta records kept in their parent's directory).
*/
struct Entity {
  std::string                       id;
  std::optional<std::string>        parent_id;
  std::map<std::string, FieldValue> fields;

  bool Has(const std::string& name) const {
    return fields.contains(name);
  }

  const std::string* GetString(const std::string& name) const {
    auto it = fields.find(name);
    return it == fields.end() ? nullptr : std::get_if<std::string>(&it->second);
  }

  const std::vector<std::string>* GetList(const std::string& name) const {
    auto it = fields.find(name);
    return it == fields.end() ? nullptr : std::get_if<std::vector<std::string>>(&it->second);
  }

  void Set(const std::string& name, std::string value) {
    fields[name] = std::move(value);
  }

  void Set(const std::string& name, std::vector<std::string> values) {
    fields[name] = std::move(values);
  }
};

} // namespace mirrorguard::storage
