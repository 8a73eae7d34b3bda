#pragma once

#include <string>
#include <string_view>

#include "internal/changeinfo/change_info.hpp"

namespace mirrorguard::changeinfo {

/*
  Commit message <-> ChangeInfo.

  Trailer lines (anywhere after the subject line):

    Entity-Action: <entity>/<action>/<id>[ parent=<parent-id>]
    Revert-Action: undo/<hash> | rollback/<hash>

  A message without any recognised trailer is untracked.
*/
class ChangeInfoMatcher {
 public:
  static constexpr std::string_view kEntityActionKey = "Entity-Action";
  static constexpr std::string_view kRevertActionKey = "Revert-Action";

  static ChangeInfo BuildChangeInfo(const std::string& commit_message);

  static std::string FormatCommitMessage(const RevertChangeInfo& info);
  static std::string FormatCommitMessage(const std::string& subject, const std::vector<EntityChangeInfo>& changes);
};

} // namespace mirrorguard::changeinfo
