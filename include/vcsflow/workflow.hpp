#pragma once
#include "config.hpp"
#include "files.hpp"
#include "result.hpp"
#include "runner.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vcsflow {

// `repo` in every option set: empty means the process working directory;
// a path naming a file means that file's directory.

struct PullOptions {
  std::string repo;
  std::string remote = "origin";
  std::string branch;
  bool rebase = false;
  bool fast_forward_only = false;
};

struct PushOptions {
  std::string repo;
  std::string remote = "origin";
  std::string branch;
  bool force = false;
  bool set_upstream = false;
  bool tags = false;
};

struct CommitOptions {
  std::string message;
  std::string repo;
  bool all = false;
  bool amend = false;
  bool allow_empty = false;
};

struct AddOptions {
  std::vector<std::string> files; // one path per entry, "." for everything
  std::string repo;
  bool include_deleted = true;
};

struct BranchOptions {
  std::string repo;
  std::string new_branch;
  std::string delete_branch;
  bool force = false;
  bool include_remote = false;
};

struct CheckoutOptions {
  std::string target;
  std::string repo;
  bool create_branch = false;
  std::vector<std::string> files;
};

struct MergeOptions {
  std::string branch;
  std::string repo;
  bool no_fast_forward = false;
  bool abort_on_conflict = false;
};

struct ResolveOptions {
  std::string file_path;
  std::string strategy; // ours | theirs | manual
  std::string repo;
  std::optional<std::string> resolved_content;
};

struct ContinueOptions {
  std::string message;
  std::string repo;
};

struct LogOptions {
  std::string repo;
  int max_count = 10;
  std::string path;
  std::string author;
  std::string since;
  bool one_line = false;
};

struct DiffOptions {
  std::string repo;
  bool staged = false;
  std::string file;
  std::string from;
  std::string to;
  bool name_only = false;
};

struct RemoteOptions {
  std::string repo;
  std::string add_name;
  std::string add_url;
  std::string remove_name;
};

struct FetchOptions {
  std::string repo;
  std::string remote = "origin";
  bool all = false;
  bool prune = false;
};

struct StashOptions {
  std::string repo;
  std::string operation = "push"; // push|pop|apply|list|drop|clear
  std::string message;
  std::string stash_ref;
  bool include_untracked = false;
};

// Nearest ancestor of `dir` (itself included) holding a `.git` directory or
// file; `dir` itself when there is none.
std::filesystem::path find_repo_root(const std::filesystem::path &dir);

// One mutex per repository, keyed by find_repo_root of the working directory.
class RepoLocks {
public:
  std::mutex &for_path(const std::filesystem::path &cwd);

private:
  std::mutex mu_;
  std::map<std::string, std::unique_ptr<std::mutex>> locks_;
};

std::filesystem::path resolve_working_dir(const std::string &repo);

// Orchestrates the git binary. Every public operation catches exceptions at
// its boundary and reports them in the returned envelope; nothing throws.
class Workflow {
public:
  explicit Workflow(Config cfg);
  Workflow(Config cfg, std::shared_ptr<CommandRunner> runner,
           std::shared_ptr<FileMutator> files);

  StatusResult status(const std::string &repo, const CancelToken &ct = {});
  PullOutcome pull(const PullOptions &o, const CancelToken &ct = {});
  RawResult push(const PushOptions &o, const CancelToken &ct = {});
  CommitResult commit(const CommitOptions &o, const CancelToken &ct = {});
  StagedResult add(const AddOptions &o, const CancelToken &ct = {});
  BranchOutcome branch(const BranchOptions &o, const CancelToken &ct = {});
  CheckoutResult checkout(const CheckoutOptions &o, const CancelToken &ct = {});
  MergeOutcome merge(const MergeOptions &o, const CancelToken &ct = {});
  ConflictDetails get_conflicts(const std::string &repo,
                                const CancelToken &ct = {});
  RawResult resolve_conflict(const ResolveOptions &o,
                             const CancelToken &ct = {});
  RawResult abort_merge(const std::string &repo, const CancelToken &ct = {});
  ContinueOutcome continue_merge(const ContinueOptions &o,
                                 const CancelToken &ct = {});
  LogOutcome log(const LogOptions &o, const CancelToken &ct = {});
  DiffOutcome diff(const DiffOptions &o, const CancelToken &ct = {});
  RemoteOutcome remote(const RemoteOptions &o, const CancelToken &ct = {});
  RawResult fetch(const FetchOptions &o, const CancelToken &ct = {});
  StashOutcome stash(const StashOptions &o, const CancelToken &ct = {});

  const Config &config() const { return cfg_; }

private:
  struct Scope {
    std::filesystem::path cwd;
    CancelToken cancel;
    std::unique_lock<std::mutex> lock;
  };

  Scope enter(const std::string &repo, const CancelToken &ct);
  CommandResult git(const Scope &s, std::vector<std::string> args);
  std::vector<std::string> conflicted_files(const Scope &s);

  template <typename R, typename Fn>
  R guarded(const char *op, Fn &&fn);

  Config cfg_;
  std::shared_ptr<CommandRunner> runner_;
  std::shared_ptr<FileMutator> files_;
  RepoLocks locks_;
};

} // namespace vcsflow
