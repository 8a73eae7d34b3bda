#include "internal/schema/db_schema_info.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/test_store.hpp"

namespace {

using mirrorguard::schema::DbSchemaInfo;
using mirrorguard::schema::EntityInfo;

void TestLoadsReferencesInDeclarationOrder() {
  const auto schema = DbSchemaInfo::LoadFromYamlString(mirrorguard::testing::kSchemaYaml);

  const std::vector<std::string> expected = {"post", "postmeta", "comment", "user", "usermeta", "term", "term_taxonomy", "option"};
  assert(schema.GetAllEntityNames() == expected);

  const auto& post = schema.GetEntityInfo("post");
  assert(post.id_column == "ID");
  assert(post.references.at("post_author") == "user");
  assert(post.mn_references.at("term_relationships") == "term_taxonomy");
  assert(!post.parent_reference.has_value());

  const auto& meta = schema.GetEntityInfo("postmeta");
  assert(meta.id_column == "id");
  assert(meta.parent_reference == std::optional<std::string>("post_id"));

  assert(schema.HasEntity("option"));
  assert(!schema.HasEntity("link"));
}

void TestReferenceFieldNames() {
  assert(EntityInfo::ReferenceField("post_author") == "vp_post_author");
  assert(EntityInfo::MnReferenceField("term_taxonomy") == "vp_term_taxonomy");
}

void TestUnknownEntityThrowsNotFound() {
  const auto schema = DbSchemaInfo::LoadFromYamlString(mirrorguard::testing::kSchemaYaml);

  bool threw = false;
  try {
    (void)schema.GetEntityInfo("link");
  } catch (const mirrorguard::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void ExpectSchemaError(const std::string& yaml) {
  bool threw = false;
  try {
    (void)DbSchemaInfo::LoadFromYamlString(yaml);
  } catch (const mirrorguard::util::SchemaError&) {
    threw = true;
  }
  assert(threw && "invalid schema must be rejected");
}

void TestInvalidSchemasAreRejected() {
  ExpectSchemaError("- post\n- comment\n");
  ExpectSchemaError("comment:\n  references:\n    comment_post_ID: post\n");
  ExpectSchemaError("post:\n  mn-references:\n    tags: tag\n");
  ExpectSchemaError("post:\nmeta:\n  parent-reference: post_id\n");
  ExpectSchemaError("post:\n  references: [user]\nuser:\n");
}

} // namespace

int main() {
  TestLoadsReferencesInDeclarationOrder();
  TestReferenceFieldNames();
  TestUnknownEntityThrowsNotFound();
  TestInvalidSchemasAreRejected();

  std::cout << "mirrorguard_unit_db_schema_info: pass\n";
  return 0;
}
