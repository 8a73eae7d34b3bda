#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "mirrorguard_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
repository:
  work_tree: /srv/store
  author_name: "Release Bot"
schema:
  path: /etc/mirrorguard/schema.yaml
storage:
  entities:
    - entity: post
      kind: directory
      path: posts
    - entity: user
      kind: single_file
      path: users.ini
database:
  sqlite:
    path: "/var/lib/mirrorguard/mirror.db"
    wal_mode: true
  gmt_offset_minutes: -300
)");

  auto config = mirrorguard::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.repository().work_tree() == "/srv/store");
  assert(config.repository().author_name() == "Release Bot");
  assert(config.storage().entities_size() == 2);
  assert(config.storage().entities(1).kind() == "single_file");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().wal_mode());
  assert(config.database().gmt_offset_minutes() == -300);

  // defaults
  assert(config.repository().author_email() == "mirrorguard@localhost");
  assert(config.storage().root_path() == "/srv/store");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\mirror\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = mirrorguard::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\mirror\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumericScalarStaysString() {
  auto config = mirrorguard::config::ConfigLoader::LoadFromYamlString(R"(repository:
  author_name: "1234"
)");
  assert(config.repository().author_name() == "1234");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(repository:
  work_tree: /srv/store
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)mirrorguard::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)mirrorguard::config::ConfigLoader::LoadFromYaml("/nonexistent/mirrorguard.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumericScalarStaysString();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();

  std::cout << "mirrorguard_unit_config_loader: pass\n";
  return 0;
}
