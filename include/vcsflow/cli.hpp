#pragma once
#include "workflow.hpp"

#include <optional>
#include <string>
#include <variant>

namespace vcsflow {

struct Globals {
  std::string repo;
  std::optional<long> timeout_ms;
  std::optional<std::string> log_level;
};

struct CmdStatus {};
struct CmdPull {
  PullOptions o;
};
struct CmdPush {
  PushOptions o;
};
struct CmdCommit {
  CommitOptions o;
};
struct CmdAdd {
  AddOptions o;
};
struct CmdBranch {
  BranchOptions o;
};
struct CmdCheckout {
  CheckoutOptions o;
};
struct CmdMerge {
  MergeOptions o;
};
struct CmdConflicts {};
struct CmdResolve {
  ResolveOptions o;
  std::string content_file; // read into o.resolved_content by the app
};
struct CmdAbortMerge {};
struct CmdContinueMerge {
  ContinueOptions o;
};
struct CmdLog {
  LogOptions o;
};
struct CmdDiff {
  DiffOptions o;
};
struct CmdRemote {
  RemoteOptions o;
};
struct CmdFetch {
  FetchOptions o;
};
struct CmdStash {
  StashOptions o;
};

struct CmdHelp {};
struct CmdVersion {};

using Command =
    std::variant<CmdStatus, CmdPull, CmdPush, CmdCommit, CmdAdd, CmdBranch,
                 CmdCheckout, CmdMerge, CmdConflicts, CmdResolve, CmdAbortMerge,
                 CmdContinueMerge, CmdLog, CmdDiff, CmdRemote, CmdFetch,
                 CmdStash, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  Globals globals;
  std::string error;
};

// The global --repo is copied into the command's options.
ParseResult parse_cli(int argc, char **argv);

} // namespace vcsflow
