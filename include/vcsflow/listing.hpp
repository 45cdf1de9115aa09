#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace vcsflow {

struct StashEntry {
  std::string ref; // stash@{N}, valid until the next stash mutation
  std::string branch;
  std::string message;
};

enum class RemoteDirection { Fetch, Push };

struct RemoteEntry {
  std::string name;
  std::string url;
  RemoteDirection direction{RemoteDirection::Fetch};
};

struct BranchEntry {
  std::string name;
  bool is_current{false};
  bool is_remote{false};
};

struct CommitEntry {
  std::string hash;
  std::string short_hash;
  std::string author;
  std::string email;
  std::string date;
  std::string message;
};

const char *to_string(RemoteDirection d);

// `stash list`: "stash@{0}: WIP on main: 1a2b3c msg" / "stash@{1}: On main: msg"
std::vector<StashEntry> parse_stash_list(std::string_view text);

// `remote -v`; duplicates by (name, direction) are collapsed.
std::vector<RemoteEntry> parse_remote_list(std::string_view text);

// `branch [-a]`
std::vector<BranchEntry> parse_branch_list(std::string_view text);

// `log --format=%H|%h|%an|%ae|%ai|%s`; missing fields stay empty and the
// subject keeps any further '|' characters.
std::vector<CommitEntry> parse_log(std::string_view text);

} // namespace vcsflow
