#include "change_set.hpp"

#include <algorithm>
#include <regex>
#include <string_view>

namespace mirrorguard::revert {

namespace {

struct SyncRule {
  std::string_view              path_part;
  std::vector<std::string_view> entities;
};

// "comments" also resyncs "post": comment counts live on the post row.
const std::vector<SyncRule>& SyncRules() {
  static const std::vector<SyncRule> rules = {
      {"posts", {"post", "postmeta"}},
      {"comments", {"comment", "post"}},
      {"users.ini", {"user", "usermeta"}},
      {"terms.ini", {"term", "term_taxonomy"}},
      {"options.ini", {"option"}},
  };
  return rules;
}

bool WasModified(const std::vector<std::string>& modified_files, std::string_view path_part) {
  return std::any_of(modified_files.begin(), modified_files.end(), [&](const std::string& file) {
    return file.find(path_part) != std::string::npos;
  });
}

} // namespace

std::vector<std::string> DetectEntitiesToSynchronize(const std::vector<std::string>& modified_files) {
  std::vector<std::string> entities;
  for (const auto& rule : SyncRules()) {
    if (!WasModified(modified_files, rule.path_part)) {
      continue;
    }
    for (auto entity : rule.entities) {
      entities.emplace_back(entity);
    }
  }
  return entities;
}

std::vector<std::string> GetAffectedPosts(const std::vector<std::string>& modified_files) {
  static const std::regex kPostFile(R"((^|/)posts/[^/]+/([^/]+)\.ini$)");

  std::vector<std::string> posts;
  for (const auto& file : modified_files) {
    std::smatch match;
    if (std::regex_search(file, match, kPostFile)) {
      posts.push_back(match[2].str());
    }
  }
  return posts;
}

} // namespace mirrorguard::revert
