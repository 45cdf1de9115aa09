#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vcsflow {

enum class StatusKind { Added, Modified, Deleted, Renamed, Copied, Unmerged, Unknown };

struct FileStatus {
  std::string path;
  StatusKind kind{StatusKind::Unknown};
};

struct RepositoryStatus {
  std::string branch;
  std::optional<std::string> upstream;
  int ahead{0};
  int behind{0};
  std::vector<FileStatus> staged;
  std::vector<FileStatus> unstaged;
  std::vector<std::string> untracked;
  std::vector<std::string> conflicted;
  std::string raw_status;

  bool is_clean() const {
    return staged.empty() && unstaged.empty() && untracked.empty() &&
           conflicted.empty();
  }
};

StatusKind status_kind_from_code(char code);
const char *to_string(StatusKind k);

// `status --porcelain=v2 --branch`. Unknown line types are skipped.
RepositoryStatus parse_porcelain_v2(std::string_view text);

// "# branch.ab +N -M"; nullopt when the line does not match.
std::optional<std::pair<int, int>> parse_ahead_behind(const std::string &line);

std::vector<std::string> split_lines(std::string_view text);

} // namespace vcsflow
