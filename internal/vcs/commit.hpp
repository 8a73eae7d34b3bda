#pragma once

#include <string>

namespace mirrorguard::vcs {

struct Commit {
  std::string hash;
  std::string author_name;
  std::string author_email;
  std::string date; // ISO-8601, as reported by the backend
  std::string message;
};

} // namespace mirrorguard::vcs
