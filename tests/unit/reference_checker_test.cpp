#include "internal/revert/reference_checker.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/revert/reference_lookup.hpp"
#include "internal/storage/directory/directory_storage.hpp"
#include "tests/support/test_store.hpp"

namespace {

using mirrorguard::revert::ReferenceChecker;
using mirrorguard::revert::ReferenceLookup;
using mirrorguard::revert::ScanningReferenceLookup;
using mirrorguard::storage::Entity;
using mirrorguard::testing::MakeEntity;
using mirrorguard::testing::MakeTestStore;
using mirrorguard::testing::TestStore;

class CountingLookup final : public ReferenceLookup {
 public:
  explicit CountingLookup(bool answer) : answer_(answer) {
  }

  bool ExistsSomeEntityWithReferenceTo(const std::string&, const std::string&) const override {
    ++calls;
    return answer_;
  }

  mutable int calls = 0;

 private:
  bool answer_;
};

ReferenceChecker MakeChecker(const TestStore& store) {
  return ReferenceChecker(store.schema, store.storages, std::make_shared<ScanningReferenceLookup>(store.schema, store.storages));
}

Entity PostWithTerms(const std::string& id, std::vector<std::string> term_taxonomies) {
  auto post = MakeEntity(id, {{"post_title", "Post " + id}, {"vp_post_author", "U1"}});
  post.Set("vp_term_taxonomy", std::move(term_taxonomies));
  return post;
}

void TestResolvableReferencesPass() {
  auto store = MakeTestStore("checker_resolvable");
  store.Save("user", MakeEntity("U1", {{"user_login", "admin"}}));
  store.Save("term", MakeEntity("T1", {{"name", "News"}}));
  store.Save("term_taxonomy", MakeEntity("TT1", {{"vp_term_id", "T1"}}));
  store.Save("post", PostWithTerms("P1", {"TT1"}));
  store.Save("comment", MakeEntity("C1", {{"vp_comment_post_ID", "P1"}, {"vp_user_id", "U1"}}));
  store.Save("postmeta", MakeEntity("M1", {{"vp_post_id", "P1"}}, "P1"));

  auto checker = MakeChecker(store);
  assert(checker.CheckEntityReferences("post", "P1", std::nullopt));
  assert(checker.CheckEntityReferences("comment", "C1", std::nullopt));
  assert(checker.CheckEntityReferences("postmeta", "M1", std::string("P1")));
  assert(checker.CheckEntityReferences("term_taxonomy", "TT1", std::nullopt));
}

void TestAbsentReferenceFieldIsNotSet() {
  auto store = MakeTestStore("checker_absent_field");
  store.Save("comment", MakeEntity("C1", {{"comment_content", "orphan but unset"}}));

  auto checker = MakeChecker(store);
  assert(checker.CheckEntityReferences("comment", "C1", std::nullopt));
}

void TestDanglingOneToManyReferenceFails() {
  auto store = MakeTestStore("checker_dangling");
  store.Save("comment", MakeEntity("C1", {{"vp_comment_post_ID", "P404"}}));

  auto checker = MakeChecker(store);
  assert(!checker.CheckEntityReferences("comment", "C1", std::nullopt));
}

void TestDanglingManyToManyReferenceFails() {
  auto store = MakeTestStore("checker_dangling_mn");
  store.Save("user", MakeEntity("U1"));
  store.Save("term_taxonomy", MakeEntity("TT1"));
  store.Save("post", PostWithTerms("P1", {"TT1", "TT404"}));

  auto checker = MakeChecker(store);
  assert(!checker.CheckEntityReferences("post", "P1", std::nullopt));
}

void TestDeletedEntityStillReferencedFails() {
  auto store = MakeTestStore("checker_deleted_referenced");
  store.Save("comment", MakeEntity("C1", {{"vp_comment_post_ID", "P1"}}));

  auto checker = MakeChecker(store);
  // P1 is gone but C1 still points at it
  assert(!checker.CheckEntityReferences("post", "P1", std::nullopt));

  store.Delete("comment", "C1");
  assert(checker.CheckEntityReferences("post", "P1", std::nullopt));
}

void TestDeletedEntityReferencedThroughManyToManyFails() {
  auto store = MakeTestStore("checker_deleted_mn");
  store.Save("user", MakeEntity("U1"));
  store.Save("post", PostWithTerms("P1", {"TT7"}));

  auto checker = MakeChecker(store);
  assert(!checker.CheckEntityReferences("term_taxonomy", "TT7", std::nullopt));
  assert(checker.CheckEntityReferences("term_taxonomy", "TT8", std::nullopt));
}

void TestEveryMatchingDeclarationIsScanned() {
  using mirrorguard::schema::DbSchemaInfo;
  using mirrorguard::schema::EntityInfo;

  EntityInfo page;
  page.entity_name = "page";

  EntityInfo link;
  link.entity_name = "link";
  link.references  = {{"first_page", "page"}, {"second_page", "page"}};

  auto schema = std::make_shared<const DbSchemaInfo>(std::vector<EntityInfo>{page, link});

  const auto dir      = mirrorguard::testing::FreshDir("checker_all_declarations");
  auto       storages = std::make_shared<mirrorguard::storage::StorageFactory>();
  storages->Register("page", std::make_shared<mirrorguard::storage::DirectoryStorage>("page", dir / "pages"));
  storages->Register("link", std::make_shared<mirrorguard::storage::DirectoryStorage>("link", dir / "links"));
  storages->GetStorage("link")->Save(MakeEntity("L1", {{"vp_first_page", "A1"}, {"vp_second_page", "B2"}}));

  ReferenceChecker checker(schema, storages, std::make_shared<ScanningReferenceLookup>(schema, storages));
  assert(!checker.CheckEntityReferences("page", "A1", std::nullopt));
  assert(!checker.CheckEntityReferences("page", "B2", std::nullopt));
  assert(checker.CheckEntityReferences("page", "C3", std::nullopt));
}

void TestIncomingScanOnlyRunsForMissingEntities() {
  auto store = MakeTestStore("checker_lookup_seam");
  store.Save("user", MakeEntity("U1"));

  auto lookup = std::make_shared<CountingLookup>(true);
  ReferenceChecker checker(store.schema, store.storages, lookup);

  assert(checker.CheckEntityReferences("user", "U1", std::nullopt));
  assert(lookup->calls == 0);

  assert(!checker.CheckEntityReferences("user", "U2", std::nullopt));
  assert(lookup->calls == 1);
}

void TestResultDependsOnlyOnStoreContents() {
  auto store = MakeTestStore("checker_pure");
  store.Save("comment", MakeEntity("C1", {{"vp_comment_post_ID", "P1"}}));

  auto       checker = MakeChecker(store);
  const bool first   = checker.CheckEntityReferences("comment", "C1", std::nullopt);
  const bool second  = checker.CheckEntityReferences("comment", "C1", std::nullopt);
  assert(first == second);
  assert(!first);
}

} // namespace

int main() {
  TestResolvableReferencesPass();
  TestAbsentReferenceFieldIsNotSet();
  TestDanglingOneToManyReferenceFails();
  TestDanglingManyToManyReferenceFails();
  TestDeletedEntityStillReferencedFails();
  TestDeletedEntityReferencedThroughManyToManyFails();
  TestEveryMatchingDeclarationIsScanned();
  TestIncomingScanOnlyRunsForMissingEntities();
  TestResultDependsOnlyOnStoreContents();

  std::cout << "mirrorguard_unit_reference_checker: pass\n";
  return 0;
}
