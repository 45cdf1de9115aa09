#include <vcsflow/runner.hpp>
#include <vcsflow/status.hpp>

#include <regex>

namespace vcsflow {

StatusKind status_kind_from_code(char code) {
  switch (code) {
  case 'M':
    return StatusKind::Modified;
  case 'A':
    return StatusKind::Added;
  case 'D':
    return StatusKind::Deleted;
  case 'R':
    return StatusKind::Renamed;
  case 'C':
    return StatusKind::Copied;
  case 'U':
    return StatusKind::Unmerged;
  default:
    return StatusKind::Unknown;
  }
}

const char *to_string(StatusKind k) {
  switch (k) {
  case StatusKind::Added:
    return "Added";
  case StatusKind::Modified:
    return "Modified";
  case StatusKind::Deleted:
    return "Deleted";
  case StatusKind::Renamed:
    return "Renamed";
  case StatusKind::Copied:
    return "Copied";
  case StatusKind::Unmerged:
    return "Unmerged";
  case StatusKind::Unknown:
    break;
  }
  return "Unknown";
}

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t nl = text.find('\n', pos);
    if (nl == std::string_view::npos)
      nl = text.size();
    std::string line(text.substr(pos, nl - pos));
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (!line.empty())
      out.push_back(std::move(line));
    pos = nl + 1;
  }
  return out;
}

// At most `max_fields` space-separated fields; the last one keeps the rest of
// the line so paths containing spaces survive.
static std::vector<std::string> split_fields(const std::string &line,
                                             size_t max_fields) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos < line.size() && out.size() + 1 < max_fields) {
    size_t sp = line.find(' ', pos);
    if (sp == std::string::npos)
      break;
    if (sp > pos)
      out.push_back(line.substr(pos, sp - pos));
    pos = sp + 1;
  }
  if (pos < line.size())
    out.push_back(line.substr(pos));
  return out;
}

static bool starts_with(const std::string &s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::optional<std::pair<int, int>> parse_ahead_behind(const std::string &line) {
  static const std::regex rx(R"(#\s*branch\.ab\s*\+(\d+)\s*-(\d+))");
  std::smatch m;
  if (!std::regex_search(line, m, rx))
    return std::nullopt;
  try {
    return std::make_pair(std::stoi(m[1].str()), std::stoi(m[2].str()));
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

RepositoryStatus parse_porcelain_v2(std::string_view text) {
  RepositoryStatus st;
  for (auto &raw : split_lines(text)) {
    if (starts_with(raw, "# branch.head ")) {
      st.branch = trim(raw.substr(14));
    } else if (starts_with(raw, "# branch.upstream ")) {
      st.upstream = trim(raw.substr(18));
    } else if (starts_with(raw, "# branch.ab")) {
      if (auto ab = parse_ahead_behind(raw)) {
        st.ahead = ab->first;
        st.behind = ab->second;
      }
    } else if (starts_with(raw, "1 ") || starts_with(raw, "2 ")) {
      // rename/copy entries carry "<path>\t<orig_path>"
      std::string line = raw;
      if (raw[0] == '2') {
        auto tab = line.find('\t');
        if (tab != std::string::npos)
          line.erase(tab);
      }
      const size_t min_fields = raw[0] == '1' ? 9 : 10;
      auto fields = split_fields(line, min_fields);
      if (fields.size() < min_fields || fields[1].size() < 2)
        continue;
      const std::string &xy = fields[1];
      const std::string &path = fields.back();
      if (xy[0] != '.')
        st.staged.push_back({path, status_kind_from_code(xy[0])});
      if (xy[1] != '.')
        st.unstaged.push_back({path, status_kind_from_code(xy[1])});
    } else if (starts_with(raw, "? ")) {
      st.untracked.push_back(trim(raw.substr(2)));
    } else if (starts_with(raw, "u ")) {
      auto fields = split_fields(raw, 11);
      if (fields.size() == 11)
        st.conflicted.push_back(fields.back());
    }
  }
  return st;
}

} // namespace vcsflow
