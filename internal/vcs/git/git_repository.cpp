#include "git_repository.hpp"

#include <git2.h>

#include <chrono>
#include <cstdio>
#include <memory>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace mirrorguard::vcs::git {

using observability::StringField;

namespace {

// ------------------------------------------------------------------
// libgit2 handles
// ------------------------------------------------------------------

template <typename T, void (*Free)(T*)>
struct GitDeleter {
  void operator()(T* p) const {
    Free(p);
  }
};

using ObjectPtr     = std::unique_ptr<git_object, GitDeleter<git_object, git_object_free>>;
using CommitPtr     = std::unique_ptr<git_commit, GitDeleter<git_commit, git_commit_free>>;
using TreePtr       = std::unique_ptr<git_tree, GitDeleter<git_tree, git_tree_free>>;
using IndexPtr      = std::unique_ptr<git_index, GitDeleter<git_index, git_index_free>>;
using DiffPtr       = std::unique_ptr<git_diff, GitDeleter<git_diff, git_diff_free>>;
using StatusListPtr = std::unique_ptr<git_status_list, GitDeleter<git_status_list, git_status_list_free>>;
using SignaturePtr  = std::unique_ptr<git_signature, GitDeleter<git_signature, git_signature_free>>;

[[noreturn]] void ThrowGit(const std::string& context) {
  const git_error* e       = git_error_last();
  std::string      message = context;
  if (e != nullptr && e->message != nullptr) {
    message += ": ";
    message += e->message;
  }
  throw util::GitError(message);
}

void Check(int rc, const std::string& context) {
  if (rc < 0) {
    ThrowGit(context);
  }
}

std::string OidToString(const git_oid* oid) {
  char buf[GIT_OID_HEXSZ + 1];
  git_oid_tostr(buf, sizeof(buf), oid);
  return buf;
}

// Accepts anything rev-parse does: full or short hashes, HEAD, "<hash>~1".
ObjectPtr Resolve(git_repository* repo, const std::string& spec, git_object_t type) {
  git_object* raw = nullptr;
  Check(git_revparse_single(&raw, repo, spec.c_str()), "cannot resolve " + spec);
  ObjectPtr object(raw);

  git_object* peeled = nullptr;
  Check(git_object_peel(&peeled, object.get(), type), "cannot peel " + spec);
  return ObjectPtr(peeled);
}

CommitPtr LookupCommit(git_repository* repo, const std::string& spec) {
  auto object = Resolve(repo, spec, GIT_OBJECT_COMMIT);
  return CommitPtr(reinterpret_cast<git_commit*>(object.release()));
}

TreePtr LookupTree(git_repository* repo, const std::string& spec) {
  auto object = Resolve(repo, spec, GIT_OBJECT_TREE);
  return TreePtr(reinterpret_cast<git_tree*>(object.release()));
}

IndexPtr OpenIndex(git_repository* repo) {
  git_index* index = nullptr;
  Check(git_repository_index(&index, repo), "cannot open index");
  return IndexPtr(index);
}

// ISO-8601 with the author's own zone, e.g. 2024-03-05T13:34:56+01:00.
std::string FormatGitTime(const git_time& when) {
  const util::TimePoint tp{std::chrono::seconds(when.time)};
  auto                  stamp = util::FormatMysqlDateTime(tp, when.offset);
  stamp[10]                   = 'T';

  const int minutes = when.offset < 0 ? -when.offset : when.offset;
  char      zone[8];
  std::snprintf(zone, sizeof(zone), "%c%02d:%02d", when.offset < 0 ? '-' : '+', minutes / 60, minutes % 60);
  return stamp + zone;
}

std::string TrimTrailingNewlines(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
    s.pop_back();
  }
  return s;
}

} // namespace

GitRepository::GitRepository(std::filesystem::path work_tree) : work_tree_(std::move(work_tree)) {
  git_libgit2_init();
}

GitRepository::~GitRepository() {
  git_repository_free(repo_);
  git_libgit2_shutdown();
}

git_repository* GitRepository::Repo() {
  if (repo_ == nullptr) {
    Check(git_repository_open_ext(&repo_, work_tree_.c_str(), GIT_REPOSITORY_OPEN_NO_SEARCH, nullptr),
          "cannot open repository " + work_tree_.string());
  }
  return repo_;
}

void GitRepository::Init() {
  std::filesystem::create_directories(work_tree_);
  if (repo_ != nullptr) {
    return;
  }
  if (git_repository_open_ext(&repo_, work_tree_.c_str(), GIT_REPOSITORY_OPEN_NO_SEARCH, nullptr) == 0) {
    return;
  }
  Check(git_repository_init(&repo_, work_tree_.c_str(), 0), "cannot create repository " + work_tree_.string());
  MIRRORGUARD_LOG_INFO("created repository", {StringField("work_tree", work_tree_.string())});
}

bool GitRepository::IsCleanWorkingDirectory() {
  git_status_options options = GIT_STATUS_OPTIONS_INIT;
  options.show               = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
  options.flags              = GIT_STATUS_OPT_INCLUDE_UNTRACKED | GIT_STATUS_OPT_RECURSE_UNTRACKED_DIRS | GIT_STATUS_OPT_EXCLUDE_SUBMODULES;

  git_status_list* raw = nullptr;
  Check(git_status_list_new(&raw, Repo(), &options), "cannot read status");
  StatusListPtr status(raw);
  return git_status_list_entrycount(status.get()) == 0;
}

std::vector<std::string> GitRepository::GetModifiedFiles(const std::string& range) {
  std::string from = range;
  std::string to   = "HEAD";
  if (const auto dots = range.find(".."); dots != std::string::npos) {
    from = range.substr(0, dots);
    to   = range.substr(dots + 2);
  }

  auto old_tree = LookupTree(Repo(), from);
  auto new_tree = LookupTree(Repo(), to);

  git_diff* raw = nullptr;
  Check(git_diff_tree_to_tree(&raw, Repo(), old_tree.get(), new_tree.get(), nullptr), "cannot diff " + range);
  DiffPtr diff(raw);

  std::vector<std::string> files;
  const auto               count = git_diff_num_deltas(diff.get());
  for (std::size_t i = 0; i < count; ++i) {
    const git_diff_delta* delta = git_diff_get_delta(diff.get(), i);
    const char*           path  = delta->status == GIT_DELTA_DELETED ? delta->old_file.path : delta->new_file.path;
    files.emplace_back(path);
  }
  return files;
}

vcs::Commit GitRepository::GetCommit(const std::string& hash) {
  auto                 commit = LookupCommit(Repo(), hash);
  const git_signature* author = git_commit_author(commit.get());
  const char*          body   = git_commit_message(commit.get());

  vcs::Commit result;
  result.hash         = OidToString(git_commit_id(commit.get()));
  result.author_name  = author->name;
  result.author_email = author->email;
  result.date         = FormatGitTime(author->when);
  result.message      = TrimTrailingNewlines(body != nullptr ? body : "");
  return result;
}

bool GitRepository::Revert(const std::string& hash) {
  auto commit = LookupCommit(Repo(), hash);

  git_revert_options options = GIT_REVERT_OPTIONS_INIT;
  Check(git_revert(Repo(), commit.get(), &options), "cannot revert " + hash);

  if (git_index_has_conflicts(OpenIndex(Repo()).get()) == 0) {
    return true;
  }

  MIRRORGUARD_LOG_WARN("revert conflicts, aborting", {StringField("commit", hash)});
  ResetToHead();
  return false;
}

void GitRepository::AbortRevert() {
  ResetToHead();
}

void GitRepository::ResetToHead() {
  auto head = Resolve(Repo(), "HEAD", GIT_OBJECT_COMMIT);
  Check(git_reset(Repo(), head.get(), GIT_RESET_HARD, nullptr), "cannot reset to HEAD");
  Check(git_repository_state_cleanup(Repo()), "cannot clear revert state");
}

void GitRepository::RevertAll(const std::string& hash) {
  // Index and work tree take the old state; HEAD is not moved.
  auto target = Resolve(Repo(), hash, GIT_OBJECT_COMMIT);

  git_checkout_options options = GIT_CHECKOUT_OPTIONS_INIT;
  options.checkout_strategy    = GIT_CHECKOUT_FORCE;
  Check(git_checkout_tree(Repo(), target.get(), &options), "cannot check out " + hash);
}

bool GitRepository::WillCommit() {
  return !IsCleanWorkingDirectory();
}

void GitRepository::Commit(const std::string& message, const std::string& author_name, const std::string& author_email) {
  auto index = OpenIndex(Repo());

  // same as `git add --all`: new, modified and deleted paths
  git_strarray everything{nullptr, 0};
  Check(git_index_add_all(index.get(), &everything, GIT_INDEX_ADD_DEFAULT, nullptr, nullptr), "cannot stage work tree");
  Check(git_index_update_all(index.get(), &everything, nullptr, nullptr), "cannot stage removals");
  Check(git_index_write(index.get()), "cannot write index");

  git_oid tree_id;
  Check(git_index_write_tree(&tree_id, index.get()), "cannot write tree");
  git_tree* raw_tree = nullptr;
  Check(git_tree_lookup(&raw_tree, Repo(), &tree_id), "cannot load tree");
  TreePtr tree(raw_tree);

  git_signature* raw_signature = nullptr;
  Check(git_signature_now(&raw_signature, author_name.c_str(), author_email.c_str()), "invalid author");
  SignaturePtr signature(raw_signature);

  // the first commit of a fresh repository has no parent
  CommitPtr   parent;
  std::size_t parent_count = 0;
  if (git_repository_head_unborn(Repo()) == 0) {
    parent       = LookupCommit(Repo(), "HEAD");
    parent_count = 1;
  }

  git_oid commit_id;
  Check(git_commit_create_v(&commit_id, Repo(), "HEAD", signature.get(), signature.get(), nullptr, message.c_str(), tree.get(),
                            parent_count, static_cast<const git_commit*>(parent.get())),
        "cannot create commit");
  Check(git_repository_state_cleanup(Repo()), "cannot clear revert state");

  MIRRORGUARD_LOG_DEBUG("committed", {StringField("commit", OidToString(&commit_id))});
}

std::string GitRepository::GetLastCommitHash() {
  git_oid head;
  Check(git_reference_name_to_id(&head, Repo(), "HEAD"), "cannot resolve HEAD");
  return OidToString(&head);
}

} // namespace mirrorguard::vcs::git
