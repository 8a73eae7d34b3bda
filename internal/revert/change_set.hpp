#pragma once

#include <string>
#include <vector>

namespace mirrorguard::revert {

/*
  Classification of the files touched by a revert.

  DetectEntitiesToSynchronize() is a work list: it may name a type
  more than once and the synchronizer tolerates that.
*/
std::vector<std::string> DetectEntitiesToSynchronize(const std::vector<std::string>& modified_files);

// vp ids of posts stored as posts/<dir>/<vp-id>.ini, in input order.
std::vector<std::string> GetAffectedPosts(const std::vector<std::string>& modified_files);

} // namespace mirrorguard::revert
