#include "internal/revert/change_set.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace {

using mirrorguard::revert::DetectEntitiesToSynchronize;
using mirrorguard::revert::GetAffectedPosts;

std::set<std::string> AsSet(const std::vector<std::string>& names) {
  return {names.begin(), names.end()};
}

void TestPostFileSynchronizesPostsAndMeta() {
  const auto entities = DetectEntitiesToSynchronize({"wp-content/vpdb/posts/0/abcd1234.ini"});
  assert(AsSet(entities) == (std::set<std::string>{"post", "postmeta"}));
}

void TestCommentsAlsoSynchronizePosts() {
  const auto entities = DetectEntitiesToSynchronize({"wp-content/vpdb/comments/xyz.ini", "wp-content/vpdb/posts/0/abcd1234.ini"});
  assert(AsSet(entities) == (std::set<std::string>{"comment", "post", "postmeta"}));
  // both rules add "post"; the list is a work list
  assert(std::count(entities.begin(), entities.end(), "post") == 2);
}

void TestSingleFileStores() {
  assert(AsSet(DetectEntitiesToSynchronize({"vpdb/users.ini"})) == (std::set<std::string>{"user", "usermeta"}));
  assert(AsSet(DetectEntitiesToSynchronize({"vpdb/terms.ini"})) == (std::set<std::string>{"term", "term_taxonomy"}));
  assert(AsSet(DetectEntitiesToSynchronize({"vpdb/options.ini"})) == (std::set<std::string>{"option"}));
}

void TestUnrelatedFilesSynchronizeNothing() {
  assert(DetectEntitiesToSynchronize({}).empty());
  assert(DetectEntitiesToSynchronize({"README.md", "uploads/2024/cat.png"}).empty());
}

void TestAffectedPostsTakeBaseNameInsidePostsDirectory() {
  const auto posts = GetAffectedPosts({"wp-content/vpdb/posts/0/abcd1234.ini", "wp-content/vpdb/terms.ini"});
  assert(posts == (std::vector<std::string>{"abcd1234"}));
}

void TestAffectedPostsIgnoreOtherLayouts() {
  const auto posts = GetAffectedPosts({
      "posts/ab/abcd.ini",
      "posts/meta/abcd/m1.ini",
      "posts/abcd.ini",
      "comments/ab/abcd.ini",
      "myposts/ab/efgh.ini",
      "posts/ef/efgh.ini.tmp",
  });
  assert(posts == (std::vector<std::string>{"abcd"}));
}

} // namespace

int main() {
  TestPostFileSynchronizesPostsAndMeta();
  TestCommentsAlsoSynchronizePosts();
  TestSingleFileStores();
  TestUnrelatedFilesSynchronizeNothing();
  TestAffectedPostsTakeBaseNameInsidePostsDirectory();
  TestAffectedPostsIgnoreOtherLayouts();

  std::cout << "mirrorguard_unit_change_set: pass\n";
  return 0;
}
