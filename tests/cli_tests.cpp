#include <catch2/catch_all.hpp>
#include <vcsflow/cli.hpp>

#include <string>
#include <vector>

using namespace vcsflow;

static ParseResult parse(std::vector<std::string> args) {
  args.insert(args.begin(), "vcsflow");
  std::vector<char *> argv;
  for (auto &a : args)
    argv.push_back(a.data());
  argv.push_back(nullptr);
  return parse_cli(static_cast<int>(args.size()), argv.data());
}

TEST_CASE("no arguments and help") {
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({}).cmd));
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({"--help"}).cmd));
  REQUIRE(std::holds_alternative<CmdVersion>(*parse({"version"}).cmd));
}

TEST_CASE("globals are accepted anywhere") {
  auto pr = parse({"pull", "--rebase", "--repo", "/tmp/r", "--timeout-ms",
                   "1500", "--branch", "dev"});
  REQUIRE(pr.error.empty());
  auto &c = std::get<CmdPull>(*pr.cmd);
  REQUIRE(c.o.repo == "/tmp/r");
  REQUIRE(c.o.rebase);
  REQUIRE(c.o.branch == "dev");
  REQUIRE(c.o.remote == "origin");
  REQUIRE(*pr.globals.timeout_ms == 1500);
}

TEST_CASE("commit message and flags") {
  auto pr = parse({"commit", "-m", "fix: thing", "--all"});
  auto &c = std::get<CmdCommit>(*pr.cmd);
  REQUIRE(c.o.message == "fix: thing");
  REQUIRE(c.o.all);
  REQUIRE_FALSE(c.o.amend);
}

TEST_CASE("add collects files") {
  auto pr = parse({"add", "a.txt", "b.txt", "--no-deleted"});
  auto &c = std::get<CmdAdd>(*pr.cmd);
  REQUIRE(c.o.files == std::vector<std::string>{"a.txt", "b.txt"});
  REQUIRE_FALSE(c.o.include_deleted);
  REQUIRE_FALSE(parse({"add"}).error.empty());
}

TEST_CASE("add keeps a path with spaces as one file") {
  auto pr = parse({"add", "my file.txt", "--", "-odd name"});
  auto &c = std::get<CmdAdd>(*pr.cmd);
  REQUIRE(c.o.files == std::vector<std::string>{"my file.txt", "-odd name"});
}

TEST_CASE("checkout with files after the separator") {
  auto pr = parse({"checkout", "main", "--", "x.txt", "-weird"});
  auto &c = std::get<CmdCheckout>(*pr.cmd);
  REQUIRE(c.o.target == "main");
  REQUIRE(c.o.files == std::vector<std::string>{"x.txt", "-weird"});

  auto spaced = parse({"checkout", "main", "--", "dir/a b.txt"});
  REQUIRE(std::get<CmdCheckout>(*spaced.cmd).o.files ==
          std::vector<std::string>{"dir/a b.txt"});
}

TEST_CASE("resolve options") {
  auto pr = parse({"resolve", "a.txt", "--strategy", "manual", "--content",
                   "merged"});
  auto &c = std::get<CmdResolve>(*pr.cmd);
  REQUIRE(c.o.file_path == "a.txt");
  REQUIRE(c.o.strategy == "manual");
  REQUIRE(*c.o.resolved_content == "merged");
  REQUIRE_FALSE(parse({"resolve", "a.txt"}).error.empty());
}

TEST_CASE("log count must be numeric") {
  auto ok = parse({"log", "-n", "5", "--oneline"});
  REQUIRE(std::get<CmdLog>(*ok.cmd).o.max_count == 5);
  REQUIRE(std::get<CmdLog>(*ok.cmd).o.one_line);
  auto bad = parse({"log", "-n", "many"});
  REQUIRE_FALSE(bad.cmd.has_value());
  REQUIRE_FALSE(bad.error.empty());
}

TEST_CASE("log count outside the int range is rejected") {
  auto wrapped = parse({"log", "-n", "4294967297"});
  REQUIRE_FALSE(wrapped.cmd.has_value());
  REQUIRE(wrapped.error.find("out of range") != std::string::npos);
  REQUIRE_FALSE(parse({"log", "--max-count", "0"}).cmd.has_value());
  REQUIRE_FALSE(parse({"log", "-n", "-4"}).cmd.has_value());
  REQUIRE(std::get<CmdLog>(*parse({"log", "-n", "2147483647"}).cmd)
              .o.max_count == 2147483647);
}

TEST_CASE("remote add takes name and url") {
  auto pr = parse({"remote", "--add", "up", "https://example.com/u.git"});
  auto &c = std::get<CmdRemote>(*pr.cmd);
  REQUIRE(c.o.add_name == "up");
  REQUIRE(c.o.add_url == "https://example.com/u.git");
  REQUIRE_FALSE(parse({"remote", "--add", "up"}).error.empty());
}

TEST_CASE("stash operation defaults to push") {
  REQUIRE(std::get<CmdStash>(*parse({"stash"}).cmd).o.operation == "push");
  auto pr = parse({"stash", "pop", "--ref", "stash@{1}"});
  REQUIRE(std::get<CmdStash>(*pr.cmd).o.operation == "pop");
  REQUIRE(std::get<CmdStash>(*pr.cmd).o.stash_ref == "stash@{1}");
}

TEST_CASE("unknown command and option") {
  auto a = parse({"frobnicate"});
  REQUIRE_FALSE(a.cmd.has_value());
  REQUIRE(a.error == "unknown command: frobnicate");
  auto b = parse({"status", "--bogus"});
  REQUIRE_FALSE(b.cmd.has_value());
  REQUIRE(b.error == "status: unexpected argument '--bogus'");
  REQUIRE_FALSE(parse({"merge", "--repo"}).error.empty());
}
