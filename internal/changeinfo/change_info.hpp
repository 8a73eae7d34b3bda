#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mirrorguard::changeinfo {

/*
  Structured description of what a commit changed, recovered from
  the commit message trailers.

  The reference checker only cares whether a commit is opaque
  (UntrackedChangeInfo) or lists the entities it touched
  (TrackedChangeInfo); the action is carried for logging only.
*/

struct EntityChangeInfo {
  std::string                entity_name;
  std::string                action; // create | edit | delete | ...
  std::string                entity_id;
  std::optional<std::string> parent_id;
};

enum class RevertAction {
  kUndo,
  kRollback,
};

struct RevertChangeInfo {
  RevertAction action = RevertAction::kUndo;
  std::string  commit_hash;
};

struct UntrackedChangeInfo {
  std::string message;
};

struct TrackedChangeInfo {
  std::vector<EntityChangeInfo>   entity_changes;
  std::optional<RevertChangeInfo> revert;
};

using ChangeInfo = std::variant<UntrackedChangeInfo, TrackedChangeInfo>;

inline bool IsUntracked(const ChangeInfo& info) {
  return std::holds_alternative<UntrackedChangeInfo>(info);
}

const char* ToString(RevertAction action);

} // namespace mirrorguard::changeinfo
