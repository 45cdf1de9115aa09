#include <vcsflow/listing.hpp>
#include <vcsflow/runner.hpp>
#include <vcsflow/status.hpp>

#include <regex>
#include <set>
#include <utility>

namespace vcsflow {

const char *to_string(RemoteDirection d) {
  return d == RemoteDirection::Push ? "push" : "fetch";
}

std::vector<StashEntry> parse_stash_list(std::string_view text) {
  static const std::regex rx(
      R"((stash@\{\d+\}):\s*(?:WIP on|On)\s*([^:]+):\s*(.*))");
  std::vector<StashEntry> out;
  for (auto &line : split_lines(text)) {
    std::smatch m;
    if (!std::regex_search(line, m, rx))
      continue;
    out.push_back({m[1].str(), m[2].str(), m[3].str()});
  }
  return out;
}

std::vector<RemoteEntry> parse_remote_list(std::string_view text) {
  static const std::regex rx(R"((\S+)\s+(\S+)\s+\((fetch|push)\))");
  std::vector<RemoteEntry> out;
  std::set<std::pair<std::string, RemoteDirection>> seen;
  for (auto &line : split_lines(text)) {
    std::smatch m;
    if (!std::regex_search(line, m, rx))
      continue;
    RemoteEntry e{m[1].str(), m[2].str(),
                  m[3].str() == "push" ? RemoteDirection::Push
                                       : RemoteDirection::Fetch};
    if (!seen.insert({e.name, e.direction}).second)
      continue;
    out.push_back(std::move(e));
  }
  return out;
}

std::vector<BranchEntry> parse_branch_list(std::string_view text) {
  std::vector<BranchEntry> out;
  for (auto &line : split_lines(text)) {
    BranchEntry b;
    b.is_current = !line.empty() && line[0] == '*';
    size_t i = 0;
    while (i < line.size() && (line[i] == '*' || line[i] == ' '))
      ++i;
    b.name = trim(line.substr(i));
    if (b.name.empty())
      continue;
    b.is_remote = b.name.find("remotes/") != std::string::npos;
    out.push_back(std::move(b));
  }
  return out;
}

std::vector<CommitEntry> parse_log(std::string_view text) {
  std::vector<CommitEntry> out;
  for (auto &line : split_lines(text)) {
    CommitEntry c;
    std::string *fields[] = {&c.hash,  &c.short_hash, &c.author,
                             &c.email, &c.date,       &c.message};
    size_t pos = 0;
    for (size_t f = 0; f < 6 && pos <= line.size(); ++f) {
      size_t bar = f == 5 ? std::string::npos : line.find('|', pos);
      if (bar == std::string::npos) {
        *fields[f] = line.substr(pos);
        break;
      }
      *fields[f] = line.substr(pos, bar - pos);
      pos = bar + 1;
    }
    out.push_back(std::move(c));
  }
  return out;
}

} // namespace vcsflow
