#include <vcsflow/errors.hpp>
#include <vcsflow/io.hpp>
#include <vcsflow/workflow.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace vcsflow {

// ------------------------ helpers ------------------------

namespace {

// git output is matched against English keywords; prompts would hang forever
// with stdin on /dev/null.
const std::unordered_map<std::string, std::string> &git_env() {
  static const std::unordered_map<std::string, std::string> env = {
      {"LC_ALL", "C"},
      {"GIT_TERMINAL_PROMPT", "0"},
      {"GIT_MERGE_AUTOEDIT", "no"},
  };
  return env;
}

bool has_conflict_keyword(const CommandResult &r) {
  return r.out.find("CONFLICT") != std::string::npos ||
         r.err.find("CONFLICT") != std::string::npos;
}

void fill(Envelope &e, const CommandResult &r, std::string ok_msg,
          std::string fail_msg) {
  e.success = r.success;
  e.kind = r.success ? ErrorKind::None : ErrorKind::Command;
  e.message = r.success ? std::move(ok_msg) : std::move(fail_msg);
  e.output = r.out;
  e.errors = r.err;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool blank(const std::string &s) { return trim(s).empty(); }

// Paths are passed after "--" exactly as given; only empty entries are dropped.
std::vector<std::string> non_blank(const std::vector<std::string> &in) {
  std::vector<std::string> out;
  for (auto &f : in)
    if (!blank(f))
      out.push_back(f);
  return out;
}

// Refs, remotes and branch names go into argv positionally; a leading '-'
// would turn them into options.
void require_name(const char *what, const std::string &v) {
  if (blank(v))
    throw ValidationError(fmt::format("{} is required", what));
  if (v[0] == '-')
    throw ValidationError(fmt::format("invalid {}: {}", what, v));
}

void check_optional_name(const char *what, const std::string &v) {
  if (!blank(v))
    require_name(what, v);
}

template <typename R> R failure(ErrorKind kind, std::string msg) {
  if constexpr (is_variant<R>::value) {
    std::variant_alternative_t<0, R> r;
    r.success = false;
    r.kind = kind;
    r.message = std::move(msg);
    return R{std::move(r)};
  } else {
    R r;
    r.success = false;
    r.kind = kind;
    r.message = std::move(msg);
    return r;
  }
}

} // namespace

fs::path find_repo_root(const fs::path &dir) {
  std::error_code ec;
  fs::path start = fs::weakly_canonical(dir, ec);
  if (ec)
    start = dir.lexically_normal();
  for (fs::path p = start; !p.empty(); p = p.parent_path()) {
    if (fs::exists(p / ".git", ec))
      return p;
    if (p == p.root_path())
      break;
  }
  return start;
}

std::mutex &RepoLocks::for_path(const fs::path &cwd) {
  auto key = find_repo_root(cwd).string();
  std::lock_guard<std::mutex> lk(mu_);
  auto &slot = locks_[key];
  if (!slot)
    slot = std::make_unique<std::mutex>();
  return *slot;
}

fs::path resolve_working_dir(const std::string &repo) {
  if (blank(repo))
    return fs::current_path();
  fs::path p = fs::absolute(trim(repo)).lexically_normal();
  std::error_code ec;
  if (fs::is_regular_file(p, ec))
    return p.parent_path();
  return p;
}

// ------------------------ core ------------------------

Workflow::Workflow(Config cfg)
    : cfg_(std::move(cfg)),
      runner_(std::make_shared<ProcessRunner>(cfg_.git_binary)),
      files_(std::make_shared<BackupFileWriter>(cfg_.backup_dir,
                                                cfg_.create_backups)) {}

Workflow::Workflow(Config cfg, std::shared_ptr<CommandRunner> runner,
                   std::shared_ptr<FileMutator> files)
    : cfg_(std::move(cfg)), runner_(std::move(runner)),
      files_(std::move(files)) {}

template <typename R, typename Fn>
R Workflow::guarded(const char *op, Fn &&fn) {
  try {
    return fn();
  } catch (const ValidationError &e) {
    spdlog::info("[flow] {} rejected: {}", op, e.what());
    return failure<R>(ErrorKind::Precondition, e.what());
  } catch (const CancelledError &) {
    spdlog::info("[flow] {} cancelled", op);
    return failure<R>(ErrorKind::Cancelled, fmt::format("{} cancelled", op));
  } catch (const TimeoutError &e) {
    return failure<R>(ErrorKind::Timeout,
                      fmt::format("Error in {}: {}", op, e.what()));
  } catch (const SpawnError &e) {
    spdlog::error("[flow] {}: {}", op, e.what());
    return failure<R>(ErrorKind::Invocation,
                      fmt::format("Error in {}: {}", op, e.what()));
  } catch (const std::exception &e) {
    spdlog::error("[flow] {}: unexpected: {}", op, e.what());
    return failure<R>(ErrorKind::Fault,
                      fmt::format("Error in {}: {}", op, e.what()));
  }
}

Workflow::Scope Workflow::enter(const std::string &repo, const CancelToken &ct) {
  Scope s{resolve_working_dir(repo), ct, {}};
  ct.throw_if_cancelled();
  if (cfg_.serialize_per_repo)
    s.lock = std::unique_lock<std::mutex>(locks_.for_path(s.cwd));
  return s;
}

CommandResult Workflow::git(const Scope &s, std::vector<std::string> args) {
  s.cancel.throw_if_cancelled();
  Invocation inv;
  inv.args = std::move(args);
  inv.cwd = s.cwd;
  inv.env = git_env();
  inv.cancel = s.cancel;
  inv.timeout = std::chrono::milliseconds(std::max(0L, cfg_.timeout_ms));
  return runner_->run(inv);
}

std::vector<std::string> Workflow::conflicted_files(const Scope &s) {
  auto r = git(s, {"diff", "--name-only", "--diff-filter=U"});
  if (!r.success)
    spdlog::debug("[flow] conflict listing failed: {}", r.err);
  std::vector<std::string> out;
  for (auto &line : split_lines(r.out)) {
    auto f = trim(line);
    if (!f.empty())
      out.push_back(std::move(f));
  }
  return out;
}

// ------------------------ status / staging ------------------------

StatusResult Workflow::status(const std::string &repo, const CancelToken &ct) {
  return guarded<StatusResult>("git status", [&] {
    auto s = enter(repo, ct);
    auto r = git(s, {"status", "--porcelain=v2", "--branch"});
    StatusResult res;
    if (!r.success) {
      fill(res, r, "", "git status failed");
      return res;
    }
    auto plain = git(s, {"status"});
    res.status = parse_porcelain_v2(r.out);
    res.status.raw_status = plain.out;
    res.success = true;
    return res;
  });
}

CommitResult Workflow::commit(const CommitOptions &o, const CancelToken &ct) {
  return guarded<CommitResult>("git commit", [&] {
    if (blank(o.message))
      throw ValidationError("commit message is required");
    auto s = enter(o.repo, ct);

    std::vector<std::string> args{"commit"};
    if (o.all)
      args.push_back("-a");
    if (o.amend)
      args.push_back("--amend");
    if (o.allow_empty)
      args.push_back("--allow-empty");
    args.push_back("-m");
    args.push_back(o.message);

    auto r = git(s, std::move(args));
    CommitResult res;
    fill(res, r, "Commit created successfully", "Commit failed");
    if (!r.success)
      return res;

    res.commit_hash = git(s, {"rev-parse", "HEAD"}).out;
    res.short_hash = git(s, {"rev-parse", "--short", "HEAD"}).out;
    spdlog::info("[flow] commit {} in {}", res.short_hash, s.cwd.string());
    return res;
  });
}

StagedResult Workflow::add(const AddOptions &o, const CancelToken &ct) {
  return guarded<StagedResult>("git add", [&] {
    auto files = non_blank(o.files);
    if (files.empty())
      throw ValidationError("files is required");
    auto s = enter(o.repo, ct);

    std::vector<std::string> args{"add"};
    if (o.include_deleted)
      args.push_back("-A");
    args.push_back("--");
    args.insert(args.end(), files.begin(), files.end());

    auto r = git(s, std::move(args));
    StagedResult res;
    fill(res, r, "Files staged successfully", "Failed to stage files");

    auto st = git(s, {"status", "--porcelain=v2"});
    for (auto &f : parse_porcelain_v2(st.out).staged)
      res.staged_files.push_back(f.path);
    return res;
  });
}

// ------------------------ branches ------------------------

BranchOutcome Workflow::branch(const BranchOptions &o, const CancelToken &ct) {
  return guarded<BranchOutcome>("git branch", [&]() -> BranchOutcome {
    check_optional_name("branch name", o.delete_branch);
    check_optional_name("branch name", o.new_branch);
    auto s = enter(o.repo, ct);

    if (!blank(o.delete_branch)) {
      auto r = git(s, {"branch", o.force ? "-D" : "-d", o.delete_branch});
      RawResult res;
      fill(res, r, fmt::format("Branch '{}' deleted", o.delete_branch),
           "Failed to delete branch");
      return res;
    }

    if (!blank(o.new_branch)) {
      auto r = git(s, {"branch", o.new_branch});
      RawResult res;
      fill(res, r, fmt::format("Branch '{}' created", o.new_branch),
           "Failed to create branch");
      return res;
    }

    std::vector<std::string> args{"branch"};
    if (o.include_remote)
      args.push_back("-a");
    auto r = git(s, std::move(args));
    BranchList res;
    fill(res, r, "", "Failed to list branches");
    res.branches = parse_branch_list(r.out);
    for (auto &b : res.branches) {
      if (b.is_current) {
        res.current_branch = b.name;
        break;
      }
    }
    return res;
  });
}

CheckoutResult Workflow::checkout(const CheckoutOptions &o,
                                  const CancelToken &ct) {
  return guarded<CheckoutResult>("git checkout", [&] {
    require_name("target", o.target);
    auto s = enter(o.repo, ct);

    std::vector<std::string> args{"checkout"};
    if (o.create_branch)
      args.push_back("-b");
    args.push_back(o.target);
    auto files = non_blank(o.files);
    if (!files.empty()) {
      args.push_back("--");
      args.insert(args.end(), files.begin(), files.end());
    }

    auto r = git(s, std::move(args));
    CheckoutResult res;
    fill(res, r, fmt::format("Checked out '{}'", o.target), "Checkout failed");
    res.current_branch = git(s, {"branch", "--show-current"}).out;
    return res;
  });
}

// ------------------------ remotes ------------------------

PullOutcome Workflow::pull(const PullOptions &o, const CancelToken &ct) {
  return guarded<PullOutcome>("git pull", [&]() -> PullOutcome {
    require_name("remote", o.remote);
    check_optional_name("branch", o.branch);
    auto s = enter(o.repo, ct);

    std::vector<std::string> args{"pull"};
    if (o.rebase)
      args.push_back("--rebase");
    if (o.fast_forward_only)
      args.push_back("--ff-only");
    args.push_back(o.remote);
    if (!blank(o.branch))
      args.push_back(o.branch);

    auto r = git(s, std::move(args));
    if (has_conflict_keyword(r)) {
      ConflictReport rep;
      rep.success = false;
      rep.kind = ErrorKind::Conflict;
      rep.message = "Pull completed with conflicts that need to be resolved";
      rep.conflicted_files = conflicted_files(s);
      rep.output = r.out;
      rep.errors = r.err;
      rep.suggestion =
          "Use resolve_conflict or abort_merge to handle conflicts";
      spdlog::info("[flow] pull: conflicts in {} file(s)",
                   rep.conflicted_files.size());
      return rep;
    }

    RawResult res;
    fill(res, r, "Pull completed successfully", "Pull failed");
    return res;
  });
}

RawResult Workflow::push(const PushOptions &o, const CancelToken &ct) {
  return guarded<RawResult>("git push", [&] {
    require_name("remote", o.remote);
    check_optional_name("branch", o.branch);
    auto s = enter(o.repo, ct);

    std::vector<std::string> args{"push"};
    if (o.force)
      args.push_back("--force");
    if (o.set_upstream)
      args.push_back("--set-upstream");
    if (o.tags)
      args.push_back("--tags");
    args.push_back(o.remote);
    if (!blank(o.branch))
      args.push_back(o.branch);

    auto r = git(s, std::move(args));
    RawResult res;
    fill(res, r, "Push completed successfully", "Push failed");
    return res;
  });
}

RawResult Workflow::fetch(const FetchOptions &o, const CancelToken &ct) {
  return guarded<RawResult>("git fetch", [&] {
    if (!o.all)
      require_name("remote", o.remote);
    auto s = enter(o.repo, ct);

    std::vector<std::string> args{"fetch"};
    if (o.all)
      args.push_back("--all");
    else
      args.push_back(o.remote);
    if (o.prune)
      args.push_back("--prune");

    auto r = git(s, std::move(args));
    RawResult res;
    fill(res, r, "Fetch completed", "Fetch failed");
    return res;
  });
}

RemoteOutcome Workflow::remote(const RemoteOptions &o, const CancelToken &ct) {
  return guarded<RemoteOutcome>("git remote", [&]() -> RemoteOutcome {
    check_optional_name("remote name", o.add_name);
    check_optional_name("remote name", o.remove_name);
    if (!blank(o.add_name) && blank(o.add_url))
      throw ValidationError("add_url is required when add_name is given");
    auto s = enter(o.repo, ct);

    if (!blank(o.add_name)) {
      auto r = git(s, {"remote", "add", o.add_name, o.add_url});
      RawResult res;
      fill(res, r, fmt::format("Remote '{}' added", o.add_name),
           "Failed to add remote");
      return res;
    }

    if (!blank(o.remove_name)) {
      auto r = git(s, {"remote", "remove", o.remove_name});
      RawResult res;
      fill(res, r, fmt::format("Remote '{}' removed", o.remove_name),
           "Failed to remove remote");
      return res;
    }

    auto r = git(s, {"remote", "-v"});
    RemoteList res;
    fill(res, r, "", "Failed to list remotes");
    res.remotes = parse_remote_list(r.out);
    return res;
  });
}

// ------------------------ merge / conflicts ------------------------

MergeOutcome Workflow::merge(const MergeOptions &o, const CancelToken &ct) {
  return guarded<MergeOutcome>("git merge", [&]() -> MergeOutcome {
    require_name("branch", o.branch);
    auto s = enter(o.repo, ct);

    std::vector<std::string> args{"merge"};
    if (o.no_fast_forward)
      args.push_back("--no-ff");
    args.push_back(o.branch);

    auto r = git(s, std::move(args));
    if (has_conflict_keyword(r)) {
      if (o.abort_on_conflict) {
        auto ab = git(s, {"merge", "--abort"});
        if (ab.success) {
          AbortedReport rep;
          rep.success = false;
          rep.kind = ErrorKind::Conflict;
          rep.message =
              "Merge aborted due to conflicts (abort_on_conflict=true)";
          rep.output = r.out;
          spdlog::info("[flow] merge {}: conflicts, aborted", o.branch);
          return rep;
        }
        spdlog::warn("[flow] merge {}: abort failed: {}", o.branch, ab.err);
      }

      ConflictReport rep;
      rep.success = false;
      rep.kind = ErrorKind::Conflict;
      rep.message = o.abort_on_conflict
                        ? "Merge has conflicts and could not be aborted"
                        : "Merge has conflicts that need to be resolved";
      rep.conflicted_files = conflicted_files(s);
      rep.output = r.out;
      rep.errors = r.err;
      rep.suggestion = "Use get_conflicts to see conflict details, then "
                       "resolve_conflict to fix them";
      spdlog::info("[flow] merge {}: conflicts in {} file(s)", o.branch,
                   rep.conflicted_files.size());
      return rep;
    }

    RawResult res;
    fill(res, r, fmt::format("Successfully merged '{}'", o.branch),
         "Merge failed");
    return res;
  });
}

ConflictDetails Workflow::get_conflicts(const std::string &repo,
                                        const CancelToken &ct) {
  return guarded<ConflictDetails>("git get conflicts", [&] {
    auto s = enter(repo, ct);
    auto files = conflicted_files(s);

    ConflictDetails res;
    res.success = true;
    if (files.empty()) {
      res.message = "No conflicts found";
      return res;
    }

    // diff --name-only prints paths relative to the top level.
    auto top = git(s, {"rev-parse", "--show-toplevel"});
    const fs::path root = top.success && !top.out.empty()
                              ? fs::path(top.out)
                              : find_repo_root(s.cwd);

    res.has_conflicts = true;
    res.conflict_count = files.size();
    for (auto &f : files) {
      auto content = io::read_file(root / f);
      if (!content)
        continue; // deleted on one side
      ConflictFile cf;
      cf.path = f;
      cf.sections = parse_conflict_sections(*content);
      cf.preview = make_preview(*content, cfg_.preview_cap);
      res.conflicts.push_back(std::move(cf));
    }
    res.suggestion =
        "Use resolve_conflict to resolve each file, or abort_merge to cancel";
    return res;
  });
}

RawResult Workflow::resolve_conflict(const ResolveOptions &o,
                                     const CancelToken &ct) {
  return guarded<RawResult>("git resolve conflict", [&] {
    const auto strategy = lower(trim(o.strategy));
    if (strategy != "ours" && strategy != "theirs" && strategy != "manual")
      throw ValidationError(fmt::format(
          "Unknown strategy: {}. Use 'ours', 'theirs', or 'manual'",
          o.strategy));
    if (strategy == "manual" &&
        (!o.resolved_content || o.resolved_content->empty()))
      throw ValidationError(
          "resolved_content is required when using 'manual' strategy");
    if (blank(o.file_path))
      throw ValidationError("file_path is required");

    auto s = enter(o.repo, ct);
    const fs::path full = s.cwd / o.file_path;
    std::error_code ec;
    if (!fs::exists(full, ec))
      throw ValidationError(fmt::format("File not found: {}", o.file_path));

    RawResult res;
    if (strategy == "manual") {
      files_->write_resolved_content(full, *o.resolved_content);
      auto add = git(s, {"add", "--", o.file_path});
      fill(res, add,
           fmt::format("Resolved '{}' with provided content and staged",
                       o.file_path),
           fmt::format("Wrote '{}' but failed to stage it", o.file_path));
      return res;
    }

    const bool ours = strategy == "ours";
    auto r = git(s, {"checkout", ours ? "--ours" : "--theirs", "--",
                     o.file_path});
    if (!r.success) {
      fill(res, r, "", "Failed to resolve");
      return res;
    }
    auto add = git(s, {"add", "--", o.file_path});
    fill(res, add,
         fmt::format("Resolved '{}' using '{}' ({} branch)", o.file_path,
                     strategy, ours ? "current" : "incoming"),
         fmt::format("Checked out '{}' but failed to stage it", o.file_path));
    if (add.success)
      res.output = r.out;
    return res;
  });
}

RawResult Workflow::abort_merge(const std::string &repo, const CancelToken &ct) {
  return guarded<RawResult>("git abort merge", [&] {
    auto s = enter(repo, ct);
    auto r = git(s, {"merge", "--abort"});
    RawResult res;
    fill(res, r, "Merge aborted successfully", "Failed to abort merge");
    return res;
  });
}

ContinueOutcome Workflow::continue_merge(const ContinueOptions &o,
                                         const CancelToken &ct) {
  return guarded<ContinueOutcome>("git continue merge",
                                  [&]() -> ContinueOutcome {
    auto s = enter(o.repo, ct);

    auto remaining = conflicted_files(s);
    if (!remaining.empty()) {
      ConflictReport rep;
      rep.success = false;
      rep.kind = ErrorKind::Precondition;
      rep.message = "Cannot continue: unresolved conflicts remain";
      rep.conflicted_files = std::move(remaining);
      rep.suggestion = "Use resolve_conflict on each remaining file";
      return rep;
    }

    std::vector<std::string> args{"commit"};
    if (blank(o.message)) {
      args.push_back("--no-edit");
    } else {
      args.push_back("-m");
      args.push_back(o.message);
    }
    auto r = git(s, std::move(args));
    RawResult res;
    fill(res, r, "Merge completed successfully", "Failed to complete merge");
    return res;
  });
}

// ------------------------ history ------------------------

LogOutcome Workflow::log(const LogOptions &o, const CancelToken &ct) {
  return guarded<LogOutcome>("git log", [&]() -> LogOutcome {
    if (o.max_count <= 0)
      throw ValidationError(
          fmt::format("max_count must be positive: {}", o.max_count));
    auto s = enter(o.repo, ct);

    std::vector<std::string> args{"log", fmt::format("-{}", o.max_count)};
    args.push_back(o.one_line ? "--oneline" : "--format=%H|%h|%an|%ae|%ai|%s");
    if (!blank(o.author))
      args.push_back("--author=" + o.author);
    if (!blank(o.since))
      args.push_back("--since=" + o.since);
    if (!blank(o.path)) {
      args.push_back("--");
      args.push_back(o.path);
    }

    auto r = git(s, std::move(args));
    if (o.one_line) {
      LineList res;
      fill(res, r, "", "git log failed");
      res.output.clear();
      res.lines = split_lines(r.out);
      return res;
    }
    CommitList res;
    fill(res, r, "", "git log failed");
    res.output.clear();
    res.commits = parse_log(r.out);
    return res;
  });
}

DiffOutcome Workflow::diff(const DiffOptions &o, const CancelToken &ct) {
  return guarded<DiffOutcome>("git diff", [&]() -> DiffOutcome {
    check_optional_name("from", o.from);
    check_optional_name("to", o.to);
    auto s = enter(o.repo, ct);

    std::vector<std::string> tail;
    if (!blank(o.from)) {
      tail.push_back(o.from);
      if (!blank(o.to))
        tail.push_back(o.to);
    }
    if (!blank(o.file)) {
      tail.push_back("--");
      tail.push_back(o.file);
    }

    auto build = [&](const char *extra) {
      std::vector<std::string> args{"diff"};
      if (extra)
        args.push_back(extra);
      if (o.staged)
        args.push_back("--staged");
      if (o.name_only)
        args.push_back("--name-only");
      args.insert(args.end(), tail.begin(), tail.end());
      return args;
    };

    auto r = git(s, build(nullptr));
    if (o.name_only) {
      NameList res;
      fill(res, r, "", "git diff failed");
      res.output.clear();
      res.files = split_lines(r.out);
      return res;
    }

    auto stat = git(s, build("--stat"));
    DiffResult res;
    fill(res, r, "", "git diff failed");
    res.output.clear();
    res.diff = truncate_text(
        r.out, cfg_.diff_cap,
        "\n... (truncated, use file parameter for specific file)");
    res.stats = stat.out;
    return res;
  });
}

// ------------------------ stash ------------------------

StashOutcome Workflow::stash(const StashOptions &o, const CancelToken &ct) {
  return guarded<StashOutcome>("git stash", [&]() -> StashOutcome {
    const auto op = lower(trim(o.operation));
    check_optional_name("stash ref", o.stash_ref);

    std::vector<std::string> args{"stash"};
    if (op == "push") {
      args.push_back("push");
      if (o.include_untracked)
        args.push_back("-u");
      if (!blank(o.message)) {
        args.push_back("-m");
        args.push_back(o.message);
      }
    } else if (op == "pop" || op == "apply" || op == "drop") {
      args.push_back(op);
      if (!blank(o.stash_ref))
        args.push_back(trim(o.stash_ref));
    } else if (op == "list" || op == "clear") {
      args.push_back(op);
    } else {
      throw ValidationError(
          fmt::format("Unknown stash operation: {}", o.operation));
    }

    auto s = enter(o.repo, ct);
    auto r = git(s, std::move(args));

    if (op == "list") {
      StashList res;
      fill(res, r, "", "Stash list failed");
      res.output.clear();
      res.stashes = parse_stash_list(r.out);
      return res;
    }

    RawResult res;
    fill(res, r, fmt::format("Stash {} completed", op),
         fmt::format("Stash {} failed", op));
    return res;
  });
}

} // namespace vcsflow
