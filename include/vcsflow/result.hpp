#pragma once
#include "conflict.hpp"
#include "listing.hpp"
#include "status.hpp"

#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace vcsflow {

enum class ErrorKind {
  None,
  Invocation,   // binary could not be started
  Command,      // non-zero exit
  Conflict,     // merge/pull left conflicts
  Precondition, // rejected before any subprocess call
  Cancelled,
  Timeout,
  Fault // unexpected exception at the operation boundary
};

const char *to_string(ErrorKind k);

struct Envelope {
  bool success{false};
  ErrorKind kind{ErrorKind::None};
  std::string message;
  std::string output;
  std::string errors; // stderr; empty when blank
};

struct RawResult : Envelope {};

struct StatusResult : Envelope {
  RepositoryStatus status;
};

struct CommitResult : Envelope {
  std::string commit_hash;
  std::string short_hash;
};

struct StagedResult : Envelope {
  std::vector<std::string> staged_files;
};

struct BranchList : Envelope {
  std::string current_branch;
  std::vector<BranchEntry> branches;
};

struct CheckoutResult : Envelope {
  std::string current_branch;
};

struct ConflictReport : Envelope {
  std::vector<std::string> conflicted_files;
  std::string suggestion;
};

struct AbortedReport : Envelope {
  bool had_conflicts{true};
};

struct ConflictDetails : Envelope {
  bool has_conflicts{false};
  std::size_t conflict_count{0};
  std::vector<ConflictFile> conflicts;
  std::string suggestion;
};

struct CommitList : Envelope {
  std::vector<CommitEntry> commits;
};

struct LineList : Envelope {
  std::vector<std::string> lines;
};

struct DiffResult : Envelope {
  std::string diff;
  std::string stats;
};

struct NameList : Envelope {
  std::vector<std::string> files;
};

struct RemoteList : Envelope {
  std::vector<RemoteEntry> remotes;
};

struct StashList : Envelope {
  std::vector<StashEntry> stashes;
};

using PullOutcome = std::variant<RawResult, ConflictReport>;
using MergeOutcome = std::variant<RawResult, ConflictReport, AbortedReport>;
using ContinueOutcome = std::variant<RawResult, ConflictReport>;
using BranchOutcome = std::variant<RawResult, BranchList>;
using LogOutcome = std::variant<CommitList, LineList>;
using DiffOutcome = std::variant<DiffResult, NameList>;
using RemoteOutcome = std::variant<RawResult, RemoteList>;
using StashOutcome = std::variant<RawResult, StashList>;

inline const Envelope &envelope_of(const Envelope &e) { return e; }

template <typename... Ts>
const Envelope &envelope_of(const std::variant<Ts...> &v) {
  return std::visit([](const auto &r) -> const Envelope & { return r; }, v);
}

template <typename T> struct is_variant : std::false_type {};
template <typename... Ts>
struct is_variant<std::variant<Ts...>> : std::true_type {};

} // namespace vcsflow
