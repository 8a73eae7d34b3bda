#pragma once

namespace mirrorguard::revert {

// Terminal outcome of a revert or rollback.
enum class RevertStatus {
  kOk,
  kMergeConflict,
  kNotCleanWorkingDirectory,
  kViolatedReferentialIntegrity,
  kNothingToCommit,
};

inline const char* ToString(RevertStatus status) {
  switch (status) {
    case RevertStatus::kOk:
      return "OK";
    case RevertStatus::kMergeConflict:
      return "MERGE_CONFLICT";
    case RevertStatus::kNotCleanWorkingDirectory:
      return "NOT_CLEAN_WORKING_DIRECTORY";
    case RevertStatus::kViolatedReferentialIntegrity:
      return "VIOLATED_REFERENTIAL_INTEGRITY";
    case RevertStatus::kNothingToCommit:
      return "NOTHING_TO_COMMIT";
  }
  return "UNKNOWN";
}

} // namespace mirrorguard::revert
