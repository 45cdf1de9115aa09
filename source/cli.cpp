#include <vcsflow/cli.hpp>

#include <limits>
#include <string_view>
#include <vector>

namespace vcsflow {

namespace {

struct Args {
  std::vector<std::string> v;
  size_t i = 0;
  std::string error;

  // Consumes the value that follows the flag at v[i].
  bool value(std::string &out) {
    if (i + 1 >= v.size()) {
      error = v[i] + " requires a value";
      return false;
    }
    out = v[++i];
    return true;
  }
};

bool to_long(const std::string &s, long &out) {
  try {
    size_t pos = 0;
    out = std::stol(s, &pos);
    return pos == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

bool positional(const std::string &a) { return !a.empty() && a[0] != '-'; }

// Hands each argument to `fn`, which returns false for anything it does not
// accept.
template <typename Fn>
std::string walk(const std::string &cmd, Args &a, Fn &&fn) {
  for (; a.i < a.v.size(); ++a.i) {
    const std::string &arg = a.v[a.i];
    if (!fn(arg)) {
      if (!a.error.empty())
        return cmd + ": " + a.error;
      return cmd + ": unexpected argument '" + arg + "'";
    }
  }
  return {};
}

// Strips --repo, --timeout-ms and --log-level from anywhere in the list.
std::string take_globals(Args &a, Globals &g) {
  std::vector<std::string> rest;
  for (a.i = 0; a.i < a.v.size(); ++a.i) {
    const std::string &arg = a.v[a.i];
    if (arg == "--") {
      rest.insert(rest.end(), a.v.begin() + a.i, a.v.end());
      break;
    }
    std::string val;
    if (arg == "--repo") {
      if (!a.value(val))
        return a.error;
      g.repo = val;
    } else if (arg == "--timeout-ms") {
      long ms = 0;
      if (!a.value(val))
        return a.error;
      if (!to_long(val, ms) || ms < 0)
        return "--timeout-ms expects a non-negative integer, got '" + val +
               "'";
      g.timeout_ms = ms;
    } else if (arg == "--log-level") {
      if (!a.value(val))
        return a.error;
      g.log_level = val;
    } else {
      rest.push_back(arg);
    }
  }
  a.v = std::move(rest);
  a.i = 0;
  a.error.clear();
  return {};
}

} // namespace

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  if (argc < 2) {
    r.cmd = CmdHelp{};
    return r;
  }

  const std::string cmd = argv[1];
  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }

  Args a;
  for (int k = 2; k < argc; ++k)
    a.v.emplace_back(argv[k]);
  if (auto err = take_globals(a, r.globals); !err.empty()) {
    r.error = cmd + ": " + err;
    return r;
  }
  const std::string &repo = r.globals.repo;

  auto finish = [&](std::string err, Command c) -> ParseResult {
    if (err.empty())
      r.cmd = std::move(c);
    else
      r.error = std::move(err);
    return r;
  };

  if (cmd == "status" || cmd == "conflicts" || cmd == "abort-merge") {
    auto err = walk(cmd, a, [](const std::string &) { return false; });
    if (cmd == "status")
      return finish(err, CmdStatus{});
    if (cmd == "conflicts")
      return finish(err, CmdConflicts{});
    return finish(err, CmdAbortMerge{});
  }

  if (cmd == "pull") {
    CmdPull c;
    c.o.repo = repo;
    auto err = walk(cmd, a, [&](const std::string &x) {
      if (x == "--remote")
        return a.value(c.o.remote);
      if (x == "--branch")
        return a.value(c.o.branch);
      if (x == "--rebase")
        return c.o.rebase = true;
      if (x == "--ff-only")
        return c.o.fast_forward_only = true;
      return false;
    });
    return finish(err, c);
  }

  if (cmd == "push") {
    CmdPush c;
    c.o.repo = repo;
    auto err = walk(cmd, a, [&](const std::string &x) {
      if (x == "--remote")
        return a.value(c.o.remote);
      if (x == "--branch")
        return a.value(c.o.branch);
      if (x == "--force")
        return c.o.force = true;
      if (x == "--set-upstream" || x == "-u")
        return c.o.set_upstream = true;
      if (x == "--tags")
        return c.o.tags = true;
      return false;
    });
    return finish(err, c);
  }

  if (cmd == "commit") {
    CmdCommit c;
    c.o.repo = repo;
    auto err = walk(cmd, a, [&](const std::string &x) {
      if (x == "-m" || x == "--message")
        return a.value(c.o.message);
      if (x == "--all" || x == "-a")
        return c.o.all = true;
      if (x == "--amend")
        return c.o.amend = true;
      if (x == "--allow-empty")
        return c.o.allow_empty = true;
      return false;
    });
    return finish(err, c);
  }

  if (cmd == "add") {
    CmdAdd c;
    c.o.repo = repo;
    bool files_only = false;
    auto err = walk(cmd, a, [&](const std::string &x) {
      if (!files_only && x == "--")
        return files_only = true;
      if (!files_only && x == "--no-deleted") {
        c.o.include_deleted = false;
        return true;
      }
      if (files_only || positional(x)) {
        c.o.files.push_back(x);
        return true;
      }
      return false;
    });
    if (err.empty() && c.o.files.empty())
      err = "add: at least one file required";
    return finish(err, c);
  }

  if (cmd == "branch") {
    CmdBranch c;
    c.o.repo = repo;
    auto err = walk(cmd, a, [&](const std::string &x) {
      if (x == "--create")
        return a.value(c.o.new_branch);
      if (x == "--delete")
        return a.value(c.o.delete_branch);
      if (x == "--force")
        return c.o.force = true;
      if (x == "--all" || x == "-a")
        return c.o.include_remote = true;
      return false;
    });
    return finish(err, c);
  }

  if (cmd == "checkout") {
    CmdCheckout c;
    c.o.repo = repo;
    bool files_only = false;
    auto err = walk(cmd, a, [&](const std::string &x) {
      if (files_only) {
        c.o.files.push_back(x);
        return true;
      }
      if (x == "--")
        return files_only = true;
      if (x == "-b" || x == "--create")
        return c.o.create_branch = true;
      if (c.o.target.empty() && positional(x)) {
        c.o.target = x;
        return true;
      }
      return false;
    });
    if (err.empty() && c.o.target.empty())
      err = "checkout: target required";
    return finish(err, c);
  }

  if (cmd == "merge") {
    CmdMerge c;
    c.o.repo = repo;
    auto err = walk(cmd, a, [&](const std::string &x) {
      if (x == "--no-ff")
        return c.o.no_fast_forward = true;
      if (x == "--abort-on-conflict")
        return c.o.abort_on_conflict = true;
      if (c.o.branch.empty() && positional(x)) {
        c.o.branch = x;
        return true;
      }
      return false;
    });
    if (err.empty() && c.o.branch.empty())
      err = "merge: branch required";
    return finish(err, c);
  }

  if (cmd == "resolve") {
    CmdResolve c;
    c.o.repo = repo;
    auto err = walk(cmd, a, [&](const std::string &x) {
      if (x == "--strategy")
        return a.value(c.o.strategy);
      if (x == "--content") {
        std::string v;
        if (!a.value(v))
          return false;
        c.o.resolved_content = v;
        return true;
      }
      if (x == "--content-file")
        return a.value(c.content_file);
      if (c.o.file_path.empty() && positional(x)) {
        c.o.file_path = x;
        return true;
      }
      return false;
    });
    if (err.empty() && c.o.file_path.empty())
      err = "resolve: file required";
    else if (err.empty() && c.o.strategy.empty())
      err = "resolve: --strategy ours|theirs|manual required";
    else if (err.empty() && c.o.resolved_content && !c.content_file.empty())
      err = "resolve: --content and --content-file are exclusive";
    return finish(err, c);
  }

  if (cmd == "continue-merge") {
    CmdContinueMerge c;
    c.o.repo = repo;
    auto err = walk(cmd, a, [&](const std::string &x) {
      if (x == "-m" || x == "--message")
        return a.value(c.o.message);
      return false;
    });
    return finish(err, c);
  }

  if (cmd == "log") {
    CmdLog c;
    c.o.repo = repo;
    auto err = walk(cmd, a, [&](const std::string &x) {
      if (x == "-n" || x == "--max-count") {
        std::string v;
        long n = 0;
        if (!a.value(v))
          return false;
        if (!to_long(v, n)) {
          a.error = x + " expects an integer, got '" + v + "'";
          return false;
        }
        if (n < 1 || n > std::numeric_limits<int>::max()) {
          a.error = x + " out of range: " + v;
          return false;
        }
        c.o.max_count = static_cast<int>(n);
        return true;
      }
      if (x == "--path")
        return a.value(c.o.path);
      if (x == "--author")
        return a.value(c.o.author);
      if (x == "--since")
        return a.value(c.o.since);
      if (x == "--oneline")
        return c.o.one_line = true;
      return false;
    });
    return finish(err, c);
  }

  if (cmd == "diff") {
    CmdDiff c;
    c.o.repo = repo;
    auto err = walk(cmd, a, [&](const std::string &x) {
      if (x == "--staged" || x == "--cached")
        return c.o.staged = true;
      if (x == "--file")
        return a.value(c.o.file);
      if (x == "--from")
        return a.value(c.o.from);
      if (x == "--to")
        return a.value(c.o.to);
      if (x == "--name-only")
        return c.o.name_only = true;
      return false;
    });
    return finish(err, c);
  }

  if (cmd == "remote") {
    CmdRemote c;
    c.o.repo = repo;
    auto err = walk(cmd, a, [&](const std::string &x) {
      if (x == "--add")
        return a.value(c.o.add_name) && a.value(c.o.add_url);
      if (x == "--remove")
        return a.value(c.o.remove_name);
      return false;
    });
    return finish(err, c);
  }

  if (cmd == "fetch") {
    CmdFetch c;
    c.o.repo = repo;
    auto err = walk(cmd, a, [&](const std::string &x) {
      if (x == "--remote")
        return a.value(c.o.remote);
      if (x == "--all")
        return c.o.all = true;
      if (x == "--prune")
        return c.o.prune = true;
      return false;
    });
    return finish(err, c);
  }

  if (cmd == "stash") {
    CmdStash c;
    c.o.repo = repo;
    bool have_op = false;
    auto err = walk(cmd, a, [&](const std::string &x) {
      if (x == "-m" || x == "--message")
        return a.value(c.o.message);
      if (x == "--ref")
        return a.value(c.o.stash_ref);
      if (x == "-u" || x == "--include-untracked")
        return c.o.include_untracked = true;
      if (!have_op && positional(x)) {
        c.o.operation = x;
        return have_op = true;
      }
      return false;
    });
    return finish(err, c);
  }

  r.error = "unknown command: " + cmd;
  return r;
}

} // namespace vcsflow
