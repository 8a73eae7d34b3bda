#include "internal/revert/reverter.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/revert/reference_lookup.hpp"
#include "internal/storage/common/file_utils.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_store.hpp"

namespace {

using mirrorguard::db::memory::MemoryRepository;
using mirrorguard::db::model::EntityRow;
using mirrorguard::revert::ReferenceChecker;
using mirrorguard::revert::Reverter;
using mirrorguard::revert::RevertStatus;
using mirrorguard::revert::ScanningReferenceLookup;
using mirrorguard::testing::MakeEntity;
using mirrorguard::testing::MakeTestStore;
using mirrorguard::testing::TestStore;

constexpr std::int32_t kGmtOffsetMinutes = 60;

// 2024-03-05 12:34:56 UTC
const mirrorguard::util::TimePoint kNow{std::chrono::seconds(1709642096)};

class FakeRepository final : public mirrorguard::vcs::Repository {
 public:
  bool IsCleanWorkingDirectory() override {
    calls.push_back("status");
    return clean;
  }

  std::vector<std::string> GetModifiedFiles(const std::string& range) override {
    calls.push_back("diff " + range);
    return modified_files;
  }

  mirrorguard::vcs::Commit GetCommit(const std::string& hash) override {
    calls.push_back("log " + hash);
    return {hash, "author", "author@example.com", "2024-03-01T00:00:00+00:00", message};
  }

  bool Revert(const std::string& hash) override {
    calls.push_back("revert " + hash);
    if (!revert_succeeds) {
      return false;
    }
    if (on_revert) on_revert();
    return true;
  }

  void AbortRevert() override {
    calls.push_back("abort");
    if (on_abort) on_abort();
  }

  void RevertAll(const std::string& hash) override {
    calls.push_back("reset " + hash);
    if (on_revert) on_revert();
  }

  bool WillCommit() override {
    return will_commit;
  }

  void Commit(const std::string& commit_message, const std::string&, const std::string&) override {
    calls.push_back("commit");
    commits.push_back(commit_message);
  }

  bool Called(const std::string& call) const {
    return std::find(calls.begin(), calls.end(), call) != calls.end();
  }

  bool                     clean           = true;
  bool                     revert_succeeds = true;
  bool                     will_commit     = true;
  std::string              message;
  std::vector<std::string> modified_files;
  std::function<void()>    on_revert;
  std::function<void()>    on_abort;

  std::vector<std::string> calls;
  std::vector<std::string> commits;
};

class FakeSynchronization final : public mirrorguard::sync::SynchronizationProcess {
 public:
  void Synchronize(const std::vector<std::string>& entity_names) override {
    requests.push_back(entity_names);
  }

  std::vector<std::vector<std::string>> requests;
};

struct Harness {
  TestStore                            store;
  std::shared_ptr<FakeRepository>      repository      = std::make_shared<FakeRepository>();
  std::shared_ptr<FakeSynchronization> synchronization = std::make_shared<FakeSynchronization>();
  std::shared_ptr<MemoryRepository>    mirror          = std::make_shared<MemoryRepository>();
  std::unique_ptr<Reverter>            reverter;

  explicit Harness(const std::string& suite) : store(MakeTestStore(suite)) {
    auto lookup    = std::make_shared<ScanningReferenceLookup>(store.schema, store.storages);
    auto checker   = std::make_shared<ReferenceChecker>(store.schema, store.storages, lookup);
    auto committer = std::make_shared<mirrorguard::vcs::Committer>(repository, "mirrorguard", "mirrorguard@localhost");
    auto clock     = std::make_shared<mirrorguard::util::FixedClock>(kNow);
    reverter = std::make_unique<Reverter>(repository, committer, checker, synchronization, mirror, clock, kGmtOffsetMinutes);
  }

  void MirrorPost(const std::string& vp_id) {
    auto tx = mirror->Begin();
    assert(mirror->UpsertEntity(*tx, EntityRow{"post", vp_id, std::nullopt, "[" + vp_id + "]\n", std::nullopt, std::nullopt}));
    tx->Commit();
  }

  std::optional<EntityRow> MirroredPost(const std::string& vp_id) {
    auto tx  = mirror->Begin();
    auto row = mirror->GetEntity(*tx, "post", vp_id);
    tx->Commit();
    return row;
  }

  // Relative path -> contents of every file in the store.
  std::map<std::string, std::string> Snapshot() const {
    std::map<std::string, std::string> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(store.root)) {
      if (entry.is_regular_file()) {
        files[std::filesystem::relative(entry.path(), store.root).string()] = mirrorguard::storage::common::ReadFile(entry.path());
      }
    }
    return files;
  }
};

void SeedPostWithComment(Harness& h) {
  h.store.Save("user", MakeEntity("U1", {{"user_login", "admin"}}));
  h.store.Save("post", MakeEntity("P1", {{"post_title", "Hello"}, {"vp_post_author", "U1"}}));
  h.store.Save("comment", MakeEntity("C1", {{"vp_comment_post_ID", "P1"}, {"comment_content", "Nice"}}));
}

void TestRevertCommitsAndSynchronizes() {
  Harness h("reverter_ok");
  SeedPostWithComment(h);
  h.MirrorPost("P1");

  h.repository->message        = "Created comment\n\nEntity-Action: comment/create/C1\n";
  h.repository->modified_files = {"comments/C1/C1.ini", "posts/P1/P1.ini", "posts/P9/P9.ini"};
  h.repository->on_revert      = [&] { h.store.Delete("comment", "C1"); };

  assert(h.reverter->Revert("abc123") == RevertStatus::kOk);

  assert(h.repository->Called("diff abc123~1..abc123"));
  assert(!h.repository->Called("abort"));
  assert(h.repository->commits.size() == 1);
  assert(h.repository->commits[0].find("Revert-Action: undo/abc123") != std::string::npos);

  assert(h.synchronization->requests.size() == 1);
  const auto& entities = h.synchronization->requests[0];
  assert(std::count(entities.begin(), entities.end(), "comment") == 1);
  assert(std::count(entities.begin(), entities.end(), "postmeta") == 1);

  const auto post = h.MirroredPost("P1");
  assert(post.has_value());
  assert(post->modified == std::optional<std::string>("2024-03-05 13:34:56"));
  assert(post->modified_gmt == std::optional<std::string>("2024-03-05 12:34:56"));
  // P9 is not mirrored; the stamp is skipped
  assert(!h.MirroredPost("P9").has_value());
}

void TestDirtyWorkingDirectoryChangesNothing() {
  Harness h("reverter_dirty");
  SeedPostWithComment(h);
  h.MirrorPost("P1");
  h.repository->clean          = false;
  h.repository->modified_files = {"posts/P1/P1.ini"};

  const auto before = h.Snapshot();
  assert(h.reverter->Revert("abc123") == RevertStatus::kNotCleanWorkingDirectory);
  assert(h.reverter->RevertAll("abc123") == RevertStatus::kNotCleanWorkingDirectory);

  assert(h.repository->calls == (std::vector<std::string>{"status", "status"}));
  assert(h.synchronization->requests.empty());
  assert(!h.MirroredPost("P1")->modified.has_value());
  assert(h.Snapshot() == before);
}

void TestMergeConflictStopsBeforeValidation() {
  Harness h("reverter_conflict");
  h.repository->revert_succeeds = false;
  h.repository->message         = "Edited post\n\nEntity-Action: post/edit/P1\n";

  assert(h.reverter->Revert("abc123") == RevertStatus::kMergeConflict);
  assert(!h.repository->Called("abort"));
  assert(h.repository->commits.empty());
  assert(h.synchronization->requests.empty());
}

void TestViolatedIntegrityAbortsAndRestoresTree() {
  Harness h("reverter_violation");
  SeedPostWithComment(h);
  h.MirrorPost("P1");

  const auto post_file = h.store.storages->GetStorage("post")->GetEntityFilename("P1", std::nullopt);
  const auto post_body = mirrorguard::storage::common::ReadFile(post_file);

  // undoing the creation of P1 deletes it while C1 still points at it
  h.repository->message        = "Created post\n\nEntity-Action: post/create/P1\n";
  h.repository->modified_files = {"posts/P1/P1.ini"};
  h.repository->on_revert      = [&] { h.store.Delete("post", "P1"); };
  h.repository->on_abort       = [&] { mirrorguard::storage::common::WriteFileAtomically(post_file, post_body); };

  const auto before = h.Snapshot();
  assert(h.reverter->Revert("abc123") == RevertStatus::kViolatedReferentialIntegrity);

  assert(h.repository->Called("abort"));
  assert(h.repository->commits.empty());
  assert(h.synchronization->requests.empty());
  assert(!h.MirroredPost("P1")->modified.has_value());
  assert(h.Snapshot() == before);
}

void TestUntrackedCommitAlwaysPassesValidation() {
  Harness h("reverter_untracked");
  SeedPostWithComment(h);

  h.repository->message   = "Manual edit over FTP\n";
  h.repository->on_revert = [&] { h.store.Delete("post", "P1"); };

  assert(h.reverter->Revert("abc123") == RevertStatus::kOk);
  assert(!h.repository->Called("abort"));
  assert(h.repository->commits.size() == 1);
}

void TestRevertOfRevertCommitPasses() {
  Harness h("reverter_revert_of_revert");
  h.repository->message = "Reverted change 0123456\n\nRevert-Action: undo/0123456789\n";

  assert(h.reverter->Revert("abc123") == RevertStatus::kOk);
  assert(h.repository->commits.size() == 1);
}

void TestCheckerFailureAbortsSpeculativeRevert() {
  Harness h("reverter_checker_failure");
  h.repository->message = "Added link\n\nEntity-Action: link/create/L1\n";

  bool threw = false;
  try {
    (void)h.reverter->Revert("abc123");
  } catch (const mirrorguard::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(h.repository->Called("abort"));
  assert(h.repository->commits.empty());
}

void TestRollbackWithoutDifferenceHasNothingToCommit() {
  Harness h("reverter_nothing_to_commit");
  h.repository->will_commit    = false;
  h.repository->modified_files = {};

  assert(h.reverter->RevertAll("abc123") == RevertStatus::kNothingToCommit);
  assert(h.repository->Called("diff abc123"));
  assert(h.repository->Called("reset abc123"));
  assert(h.repository->commits.empty());
  assert(h.synchronization->requests.empty());
}

void TestRollbackCommitsWithoutReferenceValidation() {
  Harness h("reverter_rollback_unvalidated");
  SeedPostWithComment(h);
  h.MirrorPost("P1");

  // a rollback target is taken as consistent; this dangling comment is not checked
  h.repository->message        = "Created post\n\nEntity-Action: post/create/P1\n";
  h.repository->modified_files = {"posts/P1/P1.ini", "users.ini"};
  h.repository->on_revert      = [&] { h.store.Delete("post", "P1"); };

  assert(h.reverter->RevertAll("abc123") == RevertStatus::kOk);

  assert(!h.repository->Called("log abc123"));
  assert(!h.repository->Called("abort"));
  assert(h.repository->commits.size() == 1);
  assert(h.repository->commits[0].rfind("Rolled back to abc123", 0) == 0);
  assert(h.repository->commits[0].find("Revert-Action: rollback/abc123") != std::string::npos);

  const auto& entities = h.synchronization->requests.at(0);
  assert(std::count(entities.begin(), entities.end(), "user") == 1);
  assert(std::count(entities.begin(), entities.end(), "post") == 1);
  assert(h.MirroredPost("P1")->modified_gmt == std::optional<std::string>("2024-03-05 12:34:56"));
}

} // namespace

int main() {
  TestRevertCommitsAndSynchronizes();
  TestDirtyWorkingDirectoryChangesNothing();
  TestMergeConflictStopsBeforeValidation();
  TestViolatedIntegrityAbortsAndRestoresTree();
  TestUntrackedCommitAlwaysPassesValidation();
  TestRevertOfRevertCommitPasses();
  TestCheckerFailureAbortsSpeculativeRevert();
  TestRollbackWithoutDifferenceHasNothingToCommit();
  TestRollbackCommitsWithoutReferenceValidation();

  std::cout << "mirrorguard_unit_reverter: pass\n";
  return 0;
}
