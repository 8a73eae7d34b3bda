#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/vcs/commit.hpp"

namespace mirrorguard::vcs {

/*
  Version-control backend holding the entity files.

  Revert semantics the engine relies on:

  - Revert() applies the inverse of one commit to the work tree
    without committing. On conflict it restores the pre-attempt
    state itself and returns false.
  - After a successful Revert(), AbortRevert() restores the work
    tree to the state before the Revert() call.
  - RevertAll() makes the work tree equal to the given commit
    while HEAD stays put; WillCommit() then tells whether that
    produced any difference.
*/
class Repository {
 public:
  virtual ~Repository() = default;

  virtual bool IsCleanWorkingDirectory() = 0;

  // range: "<a>..<b>" or a single commit, compared against HEAD.
  virtual std::vector<std::string> GetModifiedFiles(const std::string& range) = 0;

  virtual vcs::Commit GetCommit(const std::string& hash) = 0;

  virtual bool Revert(const std::string& hash) = 0;

  virtual void AbortRevert() = 0;

  virtual void RevertAll(const std::string& hash) = 0;

  virtual bool WillCommit() = 0;

  // Stages everything in the work tree and commits it.
  virtual void Commit(const std::string& message, const std::string& author_name, const std::string& author_email) = 0;
};

using RepositoryPtr = std::shared_ptr<Repository>;

} // namespace mirrorguard::vcs
