#include <catch2/catch_all.hpp>
#include <vcsflow/status.hpp>

using namespace vcsflow;

TEST_CASE("branch header, upstream and ahead/behind") {
  auto st = parse_porcelain_v2("# branch.oid 1234abcd\n"
                               "# branch.head main\n"
                               "# branch.upstream origin/main\n"
                               "# branch.ab +3 -1\n");
  REQUIRE(st.branch == "main");
  REQUIRE(st.upstream.has_value());
  REQUIRE(*st.upstream == "origin/main");
  REQUIRE(st.ahead == 3);
  REQUIRE(st.behind == 1);
  REQUIRE(st.is_clean());
}

TEST_CASE("no upstream leaves counters at zero") {
  auto st = parse_porcelain_v2("# branch.oid (initial)\n# branch.head main\n");
  REQUIRE_FALSE(st.upstream.has_value());
  REQUIRE(st.ahead == 0);
  REQUIRE(st.behind == 0);
}

TEST_CASE("worktree-only change is unstaged only") {
  auto st = parse_porcelain_v2(
      "1 .M N... 100644 100644 100644 aaaa bbbb src/a.cpp\n");
  REQUIRE(st.staged.empty());
  REQUIRE(st.unstaged.size() == 1);
  REQUIRE(st.unstaged[0].path == "src/a.cpp");
  REQUIRE(st.unstaged[0].kind == StatusKind::Modified);
  REQUIRE_FALSE(st.is_clean());
}

TEST_CASE("index and worktree change shows up on both sides") {
  auto st = parse_porcelain_v2(
      "1 MM N... 100644 100644 100644 aaaa bbbb b.txt\n"
      "1 A. N... 000000 100644 100644 0000 cccc new.txt\n"
      "1 D. N... 100644 000000 000000 dddd 0000 gone.txt\n");
  REQUIRE(st.staged.size() == 3);
  REQUIRE(st.unstaged.size() == 1);
  REQUIRE(st.staged[0].path == "b.txt");
  REQUIRE(st.staged[1].kind == StatusKind::Added);
  REQUIRE(st.staged[2].kind == StatusKind::Deleted);
  REQUIRE(st.unstaged[0].path == "b.txt");
}

TEST_CASE("paths with spaces are kept whole") {
  auto st = parse_porcelain_v2(
      "1 .M N... 100644 100644 100644 aaaa bbbb dir/my file.txt\n"
      "? notes and ideas.md\n");
  REQUIRE(st.unstaged.size() == 1);
  REQUIRE(st.unstaged[0].path == "dir/my file.txt");
  REQUIRE(st.untracked == std::vector<std::string>{"notes and ideas.md"});
}

TEST_CASE("rename entry reports the new path") {
  auto st = parse_porcelain_v2(
      "2 R. N... 100644 100644 100644 aaaa aaaa R100 new name.txt\told.txt\n");
  REQUIRE(st.staged.size() == 1);
  REQUIRE(st.staged[0].path == "new name.txt");
  REQUIRE(st.staged[0].kind == StatusKind::Renamed);
}

TEST_CASE("unmerged and untracked entries") {
  auto st = parse_porcelain_v2(
      "# branch.head feature\n"
      "u UU N... 100644 100644 100644 100644 aaaa bbbb cccc conflict.txt\n"
      "? scratch.txt\n");
  REQUIRE(st.conflicted == std::vector<std::string>{"conflict.txt"});
  REQUIRE(st.untracked == std::vector<std::string>{"scratch.txt"});
  REQUIRE(st.staged.empty());
  REQUIRE_FALSE(st.is_clean());
}

TEST_CASE("unknown and malformed lines are skipped") {
  auto st = parse_porcelain_v2("# branch.head main\n"
                               "! ignored.o\n"
                               "1 M\n"
                               "garbage line\n"
                               "\r\n");
  REQUIRE(st.branch == "main");
  REQUIRE(st.is_clean());
}

TEST_CASE("windows line endings") {
  auto st = parse_porcelain_v2("# branch.head main\r\n? a.txt\r\n");
  REQUIRE(st.branch == "main");
  REQUIRE(st.untracked == std::vector<std::string>{"a.txt"});
}

TEST_CASE("ahead/behind line matcher") {
  auto ab = parse_ahead_behind("# branch.ab +12 -0");
  REQUIRE(ab.has_value());
  REQUIRE(ab->first == 12);
  REQUIRE(ab->second == 0);
  REQUIRE_FALSE(parse_ahead_behind("# branch.head main").has_value());
}

TEST_CASE("status letters") {
  REQUIRE(status_kind_from_code('M') == StatusKind::Modified);
  REQUIRE(status_kind_from_code('C') == StatusKind::Copied);
  REQUIRE(status_kind_from_code('U') == StatusKind::Unmerged);
  REQUIRE(status_kind_from_code('T') == StatusKind::Unknown);
  REQUIRE(std::string(to_string(StatusKind::Renamed)) == "Renamed");
}

TEST_CASE("is_clean holds only when every collection is empty") {
  for (int mask = 0; mask < 16; ++mask) {
    RepositoryStatus st;
    if (mask & 1)
      st.staged.push_back({"s", StatusKind::Added});
    if (mask & 2)
      st.unstaged.push_back({"u", StatusKind::Modified});
    if (mask & 4)
      st.untracked.push_back("n");
    if (mask & 8)
      st.conflicted.push_back("c");
    REQUIRE(st.is_clean() == (mask == 0));
  }
}
