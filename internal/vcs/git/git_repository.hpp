#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "internal/vcs/repository.hpp"

struct git_repository;

namespace mirrorguard::vcs::git {

/*
  Repository backed by libgit2 on a local work tree.

  The repository is opened on first use; Init() creates it when
  work_tree is not one yet. Every libgit2 failure surfaces as
  util::GitError carrying libgit2's last error message, except the
  conflict path of Revert().
*/
class GitRepository final : public Repository {
 public:
  explicit GitRepository(std::filesystem::path work_tree);
  ~GitRepository() override;

  GitRepository(const GitRepository&)            = delete;
  GitRepository& operator=(const GitRepository&) = delete;

  bool                     IsCleanWorkingDirectory() override;
  std::vector<std::string> GetModifiedFiles(const std::string& range) override;
  vcs::Commit              GetCommit(const std::string& hash) override;
  bool                     Revert(const std::string& hash) override;
  void                     AbortRevert() override;
  void                     RevertAll(const std::string& hash) override;
  bool                     WillCommit() override;
  void                     Commit(const std::string& message, const std::string& author_name, const std::string& author_email) override;

  // Creates the repository when work_tree is not one yet.
  void Init();

  std::string GetLastCommitHash();

  const std::filesystem::path& WorkTree() const {
    return work_tree_;
  }

 private:
  git_repository* Repo();

  // Index and work tree back to HEAD, pending revert state dropped.
  void ResetToHead();

  std::filesystem::path work_tree_;
  git_repository*       repo_ = nullptr;
};

} // namespace mirrorguard::vcs::git
