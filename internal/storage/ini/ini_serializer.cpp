#include "ini_serializer.hpp"

#include <sstream>

#include "internal/util/errors.hpp"

namespace mirrorguard::storage::ini {

namespace {

constexpr std::string_view kListSuffix = "[]";

std::string Trim(std::string_view s) {
  const auto begin = s.find_first_not_of(" \t\r");
  if (begin == std::string_view::npos) {
    return {};
  }
  const auto end = s.find_last_not_of(" \t\r");
  return std::string(s.substr(begin, end - begin + 1));
}

[[noreturn]] void ThrowParseError(std::size_t line_number, const std::string& what) {
  throw util::StorageError("ini line " + std::to_string(line_number) + ": " + what);
}

std::string UnquoteValue(const std::string& raw, std::size_t line_number) {
  if (raw.empty() || raw.front() != '"') {
    return raw;
  }

  std::string value;
  bool        closed = false;
  for (std::size_t i = 1; i < raw.size(); ++i) {
    const char c = raw[i];
    if (c == '"') {
      if (i + 1 != raw.size()) {
        ThrowParseError(line_number, "trailing characters after closing quote");
      }
      closed = true;
      break;
    }
    if (c != '\\') {
      value.push_back(c);
      continue;
    }
    if (++i == raw.size()) {
      ThrowParseError(line_number, "dangling escape");
    }
    switch (raw[i]) {
      case 'n':
        value.push_back('\n');
        break;
      case 'r':
        value.push_back('\r');
        break;
      case 't':
        value.push_back('\t');
        break;
      default:
        value.push_back(raw[i]);
        break;
    }
  }

  if (!closed) {
    ThrowParseError(line_number, "unterminated quoted value");
  }
  return value;
}

void WriteEntity(std::ostringstream& out, const Entity& entity) {
  out << '[' << entity.id << "]\n";
  for (const auto& [name, value] : entity.fields) {
    if (const auto* scalar = std::get_if<std::string>(&value)) {
      out << name << " = \"" << IniSerializer::EscapeValue(*scalar) << "\"\n";
      continue;
    }
    for (const auto& item : std::get<std::vector<std::string>>(value)) {
      out << name << kListSuffix << " = \"" << IniSerializer::EscapeValue(item) << "\"\n";
    }
  }
}

} // namespace

std::string IniSerializer::EscapeValue(const std::string& value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (char c : value) {
    switch (c) {
      case '\\':
        escaped += "\\\\";
        break;
      case '"':
        escaped += "\\\"";
        break;
      case '\n':
        escaped += "\\n";
        break;
      case '\r':
        escaped += "\\r";
        break;
      case '\t':
        escaped += "\\t";
        break;
      default:
        escaped.push_back(c);
    }
  }
  return escaped;
}

std::string IniSerializer::Serialize(const Entity& entity) {
  std::ostringstream out;
  WriteEntity(out, entity);
  return out.str();
}

std::string IniSerializer::Serialize(const std::vector<Entity>& entities) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& entity : entities) {
    if (!first) {
      out << '\n';
    }
    first = false;
    WriteEntity(out, entity);
  }
  return out.str();
}

std::vector<Entity> IniSerializer::Deserialize(const std::string& text) {
  std::vector<Entity> entities;

  std::istringstream in(text);
  std::string        raw_line;
  std::size_t        line_number = 0;
  while (std::getline(in, raw_line)) {
    ++line_number;
    const auto line = Trim(raw_line);
    if (line.empty() || line.front() == ';' || line.front() == '#') {
      continue;
    }

    if (line.front() == '[') {
      if (line.back() != ']' || line.size() < 3) {
        ThrowParseError(line_number, "malformed section header");
      }
      Entity entity;
      entity.id = Trim(std::string_view(line).substr(1, line.size() - 2));
      entities.push_back(std::move(entity));
      continue;
    }

    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      ThrowParseError(line_number, "expected key = value");
    }
    if (entities.empty()) {
      ThrowParseError(line_number, "key outside of a section");
    }

    auto       key   = Trim(std::string_view(line).substr(0, eq));
    const auto value = UnquoteValue(Trim(std::string_view(line).substr(eq + 1)), line_number);

    auto& fields = entities.back().fields;
    if (key.size() > kListSuffix.size() && key.ends_with(kListSuffix)) {
      key.resize(key.size() - kListSuffix.size());
      auto [it, inserted] = fields.try_emplace(key, std::vector<std::string>{});
      auto* list          = std::get_if<std::vector<std::string>>(&it->second);
      if (!list) {
        ThrowParseError(line_number, "field " + key + " is both a value and a list");
      }
      list->push_back(value);
      continue;
    }

    if (key.empty()) {
      ThrowParseError(line_number, "empty key");
    }
    auto it = fields.find(key);
    if (it != fields.end() && std::holds_alternative<std::vector<std::string>>(it->second)) {
      ThrowParseError(line_number, "field " + key + " is both a value and a list");
    }
    fields[key] = value;
  }

  return entities;
}

} // namespace mirrorguard::storage::ini
