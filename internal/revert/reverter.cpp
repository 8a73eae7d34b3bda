#include "reverter.hpp"

#include "internal/changeinfo/change_info_matcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/revert/change_set.hpp"

namespace mirrorguard::revert {

namespace {

RevertStatus Finish(observability::SpanScope& span, const std::string& operation, const std::string& commit_hash, RevertStatus status) {
  span.SetAttribute("status", ToString(status));

  const auto fields = {observability::StringField("operation", operation), observability::StringField("commit", commit_hash),
                       observability::StringField("status", ToString(status))};
  if (status == RevertStatus::kOk) {
    MIRRORGUARD_LOG_INFO("revert finished", fields);
  } else {
    MIRRORGUARD_LOG_WARN("revert finished", fields);
  }
  return status;
}

} // namespace

Reverter::Reverter(vcs::RepositoryPtr repository, std::shared_ptr<vcs::Committer> committer, std::shared_ptr<const ReferenceChecker> checker,
                   sync::SynchronizationProcessPtr synchronization, db::MirrorRepositoryPtr mirror, std::shared_ptr<const util::Clock> clock,
                   std::int32_t gmt_offset_minutes)
    : repository_(std::move(repository)),
      committer_(std::move(committer)),
      checker_(std::move(checker)),
      synchronization_(std::move(synchronization)),
      mirror_(std::move(mirror)),
      clock_(std::move(clock)),
      gmt_offset_minutes_(gmt_offset_minutes) {
}

RevertStatus Reverter::Revert(const std::string& commit_hash) {
  observability::SpanScope span("mirrorguard.revert");
  span.SetAttribute("commit", commit_hash);
  MIRRORGUARD_LOG_INFO("reverting commit", {observability::StringField("commit", commit_hash)});

  if (!repository_->IsCleanWorkingDirectory()) {
    return Finish(span, "revert", commit_hash, RevertStatus::kNotCleanWorkingDirectory);
  }

  const auto modified_files  = repository_->GetModifiedFiles(commit_hash + "~1.." + commit_hash);
  const auto reverted_commit = repository_->GetCommit(commit_hash);

  if (!repository_->Revert(commit_hash)) {
    return Finish(span, "revert", commit_hash, RevertStatus::kMergeConflict);
  }

  bool references_ok = false;
  try {
    references_ok = CheckReferencesForRevertedCommit(reverted_commit);
  } catch (const std::exception& e) {
    MIRRORGUARD_LOG_ERROR("reference check failed, aborting revert", {observability::StringField("error", e.what())});
    repository_->AbortRevert();
    throw;
  }

  if (!references_ok) {
    repository_->AbortRevert();
    return Finish(span, "revert", commit_hash, RevertStatus::kViolatedReferentialIntegrity);
  }

  committer_->ForceChangeInfo({changeinfo::RevertAction::kUndo, commit_hash});
  committer_->Commit();
  span.AddEvent("committed");

  SynchronizeAfterCommit(modified_files);

  return Finish(span, "revert", commit_hash, RevertStatus::kOk);
}

RevertStatus Reverter::RevertAll(const std::string& commit_hash) {
  observability::SpanScope span("mirrorguard.rollback");
  span.SetAttribute("commit", commit_hash);
  MIRRORGUARD_LOG_INFO("rolling back to commit", {observability::StringField("commit", commit_hash)});

  if (!repository_->IsCleanWorkingDirectory()) {
    return Finish(span, "rollback", commit_hash, RevertStatus::kNotCleanWorkingDirectory);
  }

  const auto modified_files = repository_->GetModifiedFiles(commit_hash);

  repository_->RevertAll(commit_hash);

  if (!repository_->WillCommit()) {
    return Finish(span, "rollback", commit_hash, RevertStatus::kNothingToCommit);
  }

  committer_->ForceChangeInfo({changeinfo::RevertAction::kRollback, commit_hash});
  committer_->Commit();
  span.AddEvent("committed");

  SynchronizeAfterCommit(modified_files);

  return Finish(span, "rollback", commit_hash, RevertStatus::kOk);
}

bool Reverter::CheckReferencesForRevertedCommit(const vcs::Commit& reverted_commit) const {
  const auto change_info = changeinfo::ChangeInfoMatcher::BuildChangeInfo(reverted_commit.message);

  const auto* tracked = std::get_if<changeinfo::TrackedChangeInfo>(&change_info);
  if (!tracked) {
    return true;
  }

  for (const auto& change : tracked->entity_changes) {
    if (!checker_->CheckEntityReferences(change.entity_name, change.entity_id, change.parent_id)) {
      MIRRORGUARD_LOG_WARN("reverted change breaks references",
                           {observability::StringField("entity", change.entity_name), observability::StringField("id", change.entity_id),
                            observability::StringField("action", change.action)});
      return false;
    }
  }
  return true;
}

void Reverter::SynchronizeAfterCommit(const std::vector<std::string>& modified_files) {
  synchronization_->Synchronize(DetectEntitiesToSynchronize(modified_files));
  UpdateChangeDateForPosts(GetAffectedPosts(modified_files));
}

void Reverter::UpdateChangeDateForPosts(const std::vector<std::string>& vp_ids) {
  if (vp_ids.empty()) {
    return;
  }

  const auto now      = clock_->Now();
  const auto date     = util::FormatMysqlDateTime(now, gmt_offset_minutes_);
  const auto date_gmt = util::FormatMysqlDateTime(now);

  auto tx = mirror_->Begin();
  for (const auto& vp_id : vp_ids) {
    auto result = mirror_->TouchPost(*tx, vp_id, date, date_gmt);
    if (result.code == db::ErrorCode::NotFound) {
      MIRRORGUARD_LOG_WARN("post not mirrored, modification date not updated", {observability::StringField("post", vp_id)});
      continue;
    }
    db::ThrowIfDbError(result, "touch post " + vp_id);
    MIRRORGUARD_LOG_INFO("updated post modification date",
                         {observability::StringField("post", vp_id), observability::StringField("modified", date)});
  }
  tx->Commit();
}

} // namespace mirrorguard::revert
