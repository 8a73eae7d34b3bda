#include "change_info_matcher.hpp"

#include <sstream>
#include <vector>

#include "internal/observability/logging.hpp"

namespace mirrorguard::changeinfo {

namespace {

constexpr std::size_t kShortHashLength = 7;

std::string Trim(std::string_view s) {
  const auto begin = s.find_first_not_of(" \t\r");
  if (begin == std::string_view::npos) {
    return {};
  }
  const auto end = s.find_last_not_of(" \t\r");
  return std::string(s.substr(begin, end - begin + 1));
}

std::vector<std::string> Split(const std::string& s, char separator) {
  std::vector<std::string> parts;
  std::string              current;
  std::istringstream       in(s);
  while (std::getline(in, current, separator)) {
    parts.push_back(current);
  }
  if (!s.empty() && s.back() == separator) {
    parts.emplace_back();
  }
  return parts;
}

// "Key: value" -> {Key, value}; false when the line is not a trailer.
bool SplitTrailer(const std::string& line, std::string& key, std::string& value) {
  const auto colon = line.find(':');
  if (colon == std::string::npos || colon == 0) {
    return false;
  }
  key   = Trim(std::string_view(line).substr(0, colon));
  value = Trim(std::string_view(line).substr(colon + 1));
  return key.find(' ') == std::string::npos;
}

std::optional<EntityChangeInfo> ParseEntityAction(const std::string& value) {
  std::string path = value;
  std::optional<std::string> parent_id;

  const auto space = value.find(' ');
  if (space != std::string::npos) {
    path              = value.substr(0, space);
    const auto suffix = Trim(std::string_view(value).substr(space + 1));
    if (suffix.rfind("parent=", 0) != 0 || suffix.size() == 7) {
      return std::nullopt;
    }
    parent_id = suffix.substr(7);
  }

  const auto parts = Split(path, '/');
  if (parts.size() != 3 || parts[0].empty() || parts[1].empty() || parts[2].empty()) {
    return std::nullopt;
  }

  return EntityChangeInfo{parts[0], parts[1], parts[2], std::move(parent_id)};
}

std::optional<RevertChangeInfo> ParseRevertAction(const std::string& value) {
  const auto slash = value.find('/');
  if (slash == std::string::npos || slash + 1 == value.size()) {
    return std::nullopt;
  }

  const auto action = value.substr(0, slash);
  RevertChangeInfo info;
  info.commit_hash = value.substr(slash + 1);
  if (action == "undo") {
    info.action = RevertAction::kUndo;
  } else if (action == "rollback") {
    info.action = RevertAction::kRollback;
  } else {
    return std::nullopt;
  }
  return info;
}

} // namespace

const char* ToString(RevertAction action) {
  switch (action) {
    case RevertAction::kUndo:
      return "undo";
    case RevertAction::kRollback:
      return "rollback";
  }
  return "unknown";
}

ChangeInfo ChangeInfoMatcher::BuildChangeInfo(const std::string& commit_message) {
  TrackedChangeInfo tracked;
  bool              recognised = false;

  std::istringstream in(commit_message);
  std::string        line;
  bool               subject = true;
  while (std::getline(in, line)) {
    if (subject) {
      subject = false;
      continue;
    }

    std::string key;
    std::string value;
    if (!SplitTrailer(line, key, value)) {
      continue;
    }

    if (key == kEntityActionKey) {
      auto change = ParseEntityAction(value);
      if (!change) {
        MIRRORGUARD_LOG_WARN("Ignoring malformed entity action", {observability::StringField("value", value)});
        continue;
      }
      tracked.entity_changes.push_back(std::move(*change));
      recognised = true;
    } else if (key == kRevertActionKey) {
      auto revert = ParseRevertAction(value);
      if (!revert) {
        MIRRORGUARD_LOG_WARN("Ignoring malformed revert action", {observability::StringField("value", value)});
        continue;
      }
      tracked.revert = std::move(*revert);
      recognised     = true;
    }
  }

  if (!recognised) {
    return UntrackedChangeInfo{commit_message};
  }
  return tracked;
}

std::string ChangeInfoMatcher::FormatCommitMessage(const RevertChangeInfo& info) {
  const auto short_hash = info.commit_hash.substr(0, kShortHashLength);

  std::ostringstream out;
  if (info.action == RevertAction::kUndo) {
    out << "Reverted change " << short_hash;
  } else {
    out << "Rolled back to " << short_hash;
  }
  out << "\n\n" << kRevertActionKey << ": " << ToString(info.action) << '/' << info.commit_hash << '\n';
  return out.str();
}

std::string ChangeInfoMatcher::FormatCommitMessage(const std::string& subject, const std::vector<EntityChangeInfo>& changes) {
  std::ostringstream out;
  out << subject << "\n\n";
  for (const auto& change : changes) {
    out << kEntityActionKey << ": " << change.entity_name << '/' << change.action << '/' << change.entity_id;
    if (change.parent_id) {
      out << " parent=" << *change.parent_id;
    }
    out << '\n';
  }
  return out.str();
}

} // namespace mirrorguard::changeinfo
