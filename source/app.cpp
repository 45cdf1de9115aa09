#include <vcsflow/app.hpp>
#include <vcsflow/cli.hpp>
#include <vcsflow/config.hpp>
#include <vcsflow/format.hpp>
#include <vcsflow/io.hpp>
#include <vcsflow/workflow.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <signal.h>
#include <iostream>
#include <string>

#ifndef VCSFLOW_COMMIT
#define VCSFLOW_COMMIT "unknown"
#endif
#ifndef VCSFLOW_BRANCH
#define VCSFLOW_BRANCH "unknown"
#endif
#ifndef VCSFLOW_BUILD_TIME
#define VCSFLOW_BUILD_TIME "unknown"
#endif

namespace vcsflow {

static void print_help() {
  std::cout <<
      R"(vcsflow - git workflow runner with structured (JSON) results

Usage:
  vcsflow status
  vcsflow pull     [--remote origin] [--branch B] [--rebase] [--ff-only]
  vcsflow push     [--remote origin] [--branch B] [--force] [--set-upstream] [--tags]
  vcsflow commit   -m <message> [--all] [--amend] [--allow-empty]
  vcsflow add      <file>... [--no-deleted]
  vcsflow branch   [--create NAME | --delete NAME [--force]] [--all]
  vcsflow checkout <target> [-b] [-- <file>...]
  vcsflow merge    <branch> [--no-ff] [--abort-on-conflict]
  vcsflow conflicts
  vcsflow resolve  <file> --strategy ours|theirs|manual [--content TEXT | --content-file PATH]
  vcsflow abort-merge
  vcsflow continue-merge [-m <message>]
  vcsflow log      [-n 10] [--path P] [--author A] [--since S] [--oneline]
  vcsflow diff     [--staged] [--file F] [--from REF] [--to REF] [--name-only]
  vcsflow remote   [--add NAME URL | --remove NAME]
  vcsflow fetch    [--remote origin] [--all] [--prune]
  vcsflow stash    [push|pop|apply|list|drop|clear] [-m MSG] [--ref stash@{N}] [-u]

Global options:
  --repo <path>        repository directory (default: current directory)
  --timeout-ms <n>     kill git after n milliseconds (0: no limit)
  --log-level <lvl>    trace|debug|info|warn|err|off

Environment: VCSFLOW_GIT, VCSFLOW_TIMEOUT_MS, VCSFLOW_SERIALIZE, VCSFLOW_LOG_LEVEL,
  VCSFLOW_LOG_FILE, VCSFLOW_LOG_MAX_MB, VCSFLOW_LOG_FILES, VCSFLOW_BACKUPS,
  VCSFLOW_BACKUP_DIR

Exit status: 0 success, 1 operation failed, 2 usage error.
)";
}

static CancelToken g_cancel;

extern "C" void on_interrupt(int) { g_cancel.cancel(); }

static void install_interrupt_handler() {
  struct sigaction sa {};
  sa.sa_handler = on_interrupt;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

template <typename R> static int emit(const R &r) {
  std::cout << to_json(r);
  std::cout.flush();
  return envelope_of(r).success ? 0 : 1;
}

int App::run(int argc, char **argv) {
  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  Config cfg = Config::from_env();
  if (pr.globals.timeout_ms)
    cfg.timeout_ms = *pr.globals.timeout_ms;
  if (pr.globals.log_level)
    cfg.log_level = *pr.globals.log_level;
  setup_logging(cfg);
  install_interrupt_handler();

  Workflow wf(cfg);
  const std::string &repo = pr.globals.repo;
  const CancelToken &ct = g_cancel;

  return std::visit(
      [&](auto &&c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_help();
          return 0;

        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          std::cout << fmt::format("vcsflow {} ({}, built {})\n",
                                   VCSFLOW_COMMIT, VCSFLOW_BRANCH,
                                   VCSFLOW_BUILD_TIME);
          return 0;

        } else if constexpr (std::is_same_v<T, CmdStatus>) {
          return emit(wf.status(repo, ct));
        } else if constexpr (std::is_same_v<T, CmdPull>) {
          return emit(wf.pull(c.o, ct));
        } else if constexpr (std::is_same_v<T, CmdPush>) {
          return emit(wf.push(c.o, ct));
        } else if constexpr (std::is_same_v<T, CmdCommit>) {
          return emit(wf.commit(c.o, ct));
        } else if constexpr (std::is_same_v<T, CmdAdd>) {
          return emit(wf.add(c.o, ct));
        } else if constexpr (std::is_same_v<T, CmdBranch>) {
          return emit(wf.branch(c.o, ct));
        } else if constexpr (std::is_same_v<T, CmdCheckout>) {
          return emit(wf.checkout(c.o, ct));
        } else if constexpr (std::is_same_v<T, CmdMerge>) {
          return emit(wf.merge(c.o, ct));
        } else if constexpr (std::is_same_v<T, CmdConflicts>) {
          return emit(wf.get_conflicts(repo, ct));

        } else if constexpr (std::is_same_v<T, CmdResolve>) {
          ResolveOptions o = c.o;
          if (!c.content_file.empty()) {
            auto content = io::read_file(c.content_file);
            if (!content) {
              spdlog::error("resolve: cannot read {}", c.content_file);
              return 2;
            }
            o.resolved_content = std::move(*content);
          }
          return emit(wf.resolve_conflict(o, ct));

        } else if constexpr (std::is_same_v<T, CmdAbortMerge>) {
          return emit(wf.abort_merge(repo, ct));
        } else if constexpr (std::is_same_v<T, CmdContinueMerge>) {
          return emit(wf.continue_merge(c.o, ct));
        } else if constexpr (std::is_same_v<T, CmdLog>) {
          return emit(wf.log(c.o, ct));
        } else if constexpr (std::is_same_v<T, CmdDiff>) {
          return emit(wf.diff(c.o, ct));
        } else if constexpr (std::is_same_v<T, CmdRemote>) {
          return emit(wf.remote(c.o, ct));
        } else if constexpr (std::is_same_v<T, CmdFetch>) {
          return emit(wf.fetch(c.o, ct));
        } else {
          static_assert(std::is_same_v<T, CmdStash>);
          return emit(wf.stash(c.o, ct));
        }
      },
      *pr.cmd);
}

} // namespace vcsflow
