#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/mirror_repository.hpp"
#include "internal/revert/reference_checker.hpp"
#include "internal/revert/revert_status.hpp"
#include "internal/sync/synchronization_process.hpp"
#include "internal/util/time.hpp"
#include "internal/vcs/commit.hpp"
#include "internal/vcs/committer.hpp"
#include "internal/vcs/repository.hpp"

namespace mirrorguard::revert {

/*
  Reverter

  Undoes one commit (Revert) or rolls the store back to an earlier
  commit (RevertAll) and brings the relational mirror in line.

  Revert:
    clean tree? -> capture files + message -> speculative revert
      -> validate every entity change -> commit -> sync + stamp posts

  Nothing before the commit is visible outside the work tree; a
  failed validation aborts the speculative revert.

  RevertAll commits without reference validation. A rollback
  target was a committed state, and the path is kept unvalidated.

  Expected outcomes are returned as RevertStatus. Collaborator
  failures throw; after the commit they are not compensated.

  Not thread-safe; one revert per store at a time.
*/
class Reverter {
 public:
  Reverter(vcs::RepositoryPtr repository, std::shared_ptr<vcs::Committer> committer, std::shared_ptr<const ReferenceChecker> checker,
           sync::SynchronizationProcessPtr synchronization, db::MirrorRepositoryPtr mirror, std::shared_ptr<const util::Clock> clock,
           std::int32_t gmt_offset_minutes = 0);

  RevertStatus Revert(const std::string& commit_hash);

  RevertStatus RevertAll(const std::string& commit_hash);

 private:
  bool CheckReferencesForRevertedCommit(const vcs::Commit& reverted_commit) const;

  void SynchronizeAfterCommit(const std::vector<std::string>& modified_files);

  void UpdateChangeDateForPosts(const std::vector<std::string>& vp_ids);

  vcs::RepositoryPtr                      repository_;
  std::shared_ptr<vcs::Committer>         committer_;
  std::shared_ptr<const ReferenceChecker> checker_;
  sync::SynchronizationProcessPtr         synchronization_;
  db::MirrorRepositoryPtr                 mirror_;
  std::shared_ptr<const util::Clock>      clock_;
  std::int32_t                            gmt_offset_minutes_;
};

} // namespace mirrorguard::revert
