#include "internal/changeinfo/change_info_matcher.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <variant>

namespace {

using mirrorguard::changeinfo::ChangeInfoMatcher;
using mirrorguard::changeinfo::EntityChangeInfo;
using mirrorguard::changeinfo::RevertAction;
using mirrorguard::changeinfo::RevertChangeInfo;
using mirrorguard::changeinfo::TrackedChangeInfo;
using mirrorguard::changeinfo::UntrackedChangeInfo;

void TestMessageWithoutTrailersIsUntracked() {
  const auto info = ChangeInfoMatcher::BuildChangeInfo("Fix typo in the footer\n\nManual edit.\n");
  assert(std::holds_alternative<UntrackedChangeInfo>(info));
  assert(std::get<UntrackedChangeInfo>(info).message == "Fix typo in the footer\n\nManual edit.\n");
}

void TestEntityActionsKeepDeclaredOrder() {
  const auto info = ChangeInfoMatcher::BuildChangeInfo(
      "Edited post\n\n"
      "Entity-Action: post/edit/AB12\n"
      "Entity-Action: postmeta/create/CD34 parent=AB12\n");

  const auto* tracked = std::get_if<TrackedChangeInfo>(&info);
  assert(tracked);
  assert(tracked->entity_changes.size() == 2);
  assert(!tracked->revert.has_value());

  const auto& first = tracked->entity_changes[0];
  assert(first.entity_name == "post");
  assert(first.action == "edit");
  assert(first.entity_id == "AB12");
  assert(!first.parent_id.has_value());

  const auto& second = tracked->entity_changes[1];
  assert(second.entity_name == "postmeta");
  assert(second.entity_id == "CD34");
  assert(second.parent_id == std::optional<std::string>("AB12"));
}

void TestSubjectLineIsNotParsedAsTrailer() {
  const auto info = ChangeInfoMatcher::BuildChangeInfo("Entity-Action: post/delete/AB12\n");
  assert(std::holds_alternative<UntrackedChangeInfo>(info));
}

void TestMalformedEntityActionsAreIgnored() {
  const auto only_malformed = ChangeInfoMatcher::BuildChangeInfo("subject\n\nEntity-Action: post/AB12\n");
  assert(std::holds_alternative<UntrackedChangeInfo>(only_malformed));

  const auto mixed = ChangeInfoMatcher::BuildChangeInfo(
      "subject\n\n"
      "Entity-Action: post//AB12\n"
      "Entity-Action: comment/create/C1 parent\n"
      "Entity-Action: comment/create/C2\n");
  const auto* tracked = std::get_if<TrackedChangeInfo>(&mixed);
  assert(tracked);
  assert(tracked->entity_changes.size() == 1);
  assert(tracked->entity_changes[0].entity_id == "C2");
}

void TestRevertCommitIsTrackedWithoutEntityChanges() {
  const auto message = ChangeInfoMatcher::FormatCommitMessage(RevertChangeInfo{RevertAction::kUndo, "0123456789abcdef"});
  assert(message.rfind("Reverted change 0123456\n", 0) == 0);
  assert(message.find("Revert-Action: undo/0123456789abcdef") != std::string::npos);

  const auto  info    = ChangeInfoMatcher::BuildChangeInfo(message);
  const auto* tracked = std::get_if<TrackedChangeInfo>(&info);
  assert(tracked);
  assert(tracked->entity_changes.empty());
  assert(tracked->revert.has_value());
  assert(tracked->revert->action == RevertAction::kUndo);
  assert(tracked->revert->commit_hash == "0123456789abcdef");
}

void TestRollbackSubject() {
  const auto message = ChangeInfoMatcher::FormatCommitMessage(RevertChangeInfo{RevertAction::kRollback, "fedcba9876543210"});
  assert(message.rfind("Rolled back to fedcba9\n", 0) == 0);

  const auto info = ChangeInfoMatcher::BuildChangeInfo(message);
  assert(std::get<TrackedChangeInfo>(info).revert->action == RevertAction::kRollback);
}

void TestFormattedEntityChangesParseBack() {
  const auto message = ChangeInfoMatcher::FormatCommitMessage(
      "Created comment", {EntityChangeInfo{"comment", "create", "C9", std::nullopt}, EntityChangeInfo{"postmeta", "delete", "M1", "P1"}});

  const auto  info    = ChangeInfoMatcher::BuildChangeInfo(message);
  const auto& changes = std::get<TrackedChangeInfo>(info).entity_changes;
  assert(changes.size() == 2);
  assert(changes[0].entity_name == "comment" && changes[0].action == "create" && changes[0].entity_id == "C9");
  assert(changes[1].parent_id == std::optional<std::string>("P1"));
}

} // namespace

int main() {
  TestMessageWithoutTrailersIsUntracked();
  TestEntityActionsKeepDeclaredOrder();
  TestSubjectLineIsNotParsedAsTrailer();
  TestMalformedEntityActionsAreIgnored();
  TestRevertCommitIsTrackedWithoutEntityChanges();
  TestRollbackSubject();
  TestFormattedEntityChangesParseBack();

  std::cout << "mirrorguard_unit_change_info_matcher: pass\n";
  return 0;
}
