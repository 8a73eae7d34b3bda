#include "committer.hpp"

#include "internal/changeinfo/change_info_matcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mirrorguard::vcs {

Committer::Committer(RepositoryPtr repository, std::string author_name, std::string author_email)
    : repository_(std::move(repository)), author_name_(std::move(author_name)), author_email_(std::move(author_email)) {
}

void Committer::ForceChangeInfo(changeinfo::RevertChangeInfo info) {
  forced_ = std::move(info);
}

void Committer::Commit() {
  if (!forced_) {
    throw util::InvalidState("commit requested without a change description");
  }

  const auto message = changeinfo::ChangeInfoMatcher::FormatCommitMessage(*forced_);
  repository_->Commit(message, author_name_, author_email_);

  MIRRORGUARD_LOG_INFO("Committed",
                       {observability::StringField("action", changeinfo::ToString(forced_->action)),
                        observability::StringField("target", forced_->commit_hash)});
  forced_.reset();
}

} // namespace mirrorguard::vcs
