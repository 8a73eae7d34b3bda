#pragma once

#include <optional>
#include <string>

#include "internal/changeinfo/change_info.hpp"
#include "internal/vcs/repository.hpp"

namespace mirrorguard::vcs {

/*
  Turns pending work-tree changes into a commit whose message
  carries a structured change description.

  ForceChangeInfo() pins the description of the next Commit();
  it is consumed by that commit.
*/
class Committer {
 public:
  Committer(RepositoryPtr repository, std::string author_name, std::string author_email);

  void ForceChangeInfo(changeinfo::RevertChangeInfo info);

  // Throws util::InvalidState without a forced change info.
  void Commit();

 private:
  RepositoryPtr                               repository_;
  std::string                                 author_name_;
  std::string                                 author_email_;
  std::optional<changeinfo::RevertChangeInfo> forced_;
};

} // namespace mirrorguard::vcs
