#include <catch2/catch_all.hpp>
#include <vcsflow/errors.hpp>
#include <vcsflow/runner.hpp>

#include <chrono>
#include <filesystem>
#include <thread>

using namespace vcsflow;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

static fs::path mkd(const char* name){
  auto d = fs::temp_directory_path() / (std::string("vcsflow_runner_")+name);
  fs::create_directories(d);
  return d;
}

static Invocation sh(const std::string& script, const fs::path& cwd){
  Invocation inv;
  inv.args = {"-c", script};
  inv.cwd = cwd;
  return inv;
}

TEST_CASE("captures stdout, stderr and exit code") {
  ProcessRunner r("sh");
  auto res = r.run(sh("echo out; echo err 1>&2; exit 3", mkd("basic")));
  REQUIRE_FALSE(res.success);
  REQUIRE(res.exit_code == 3);
  REQUIRE(res.out == "out");
  REQUIRE(res.err == "err");
}

TEST_CASE("runs in the given directory with extra environment") {
  auto d = mkd("cwd");
  ProcessRunner r("sh");
  auto inv = sh("pwd; printf %s \"$VCSFLOW_TEST_VAR\" 1>&2", d);
  inv.env["VCSFLOW_TEST_VAR"] = "hello";
  auto res = r.run(inv);
  REQUIRE(res.success);
  REQUIRE(fs::equivalent(res.out, d));
  REQUIRE(res.err == "hello");
}

TEST_CASE("missing binary is a spawn error") {
  ProcessRunner r("vcsflow-no-such-binary-xyz");
  Invocation inv;
  inv.args = {"--version"};
  inv.cwd = mkd("missing_bin");
  REQUIRE_THROWS_AS(r.run(inv), SpawnError);
}

TEST_CASE("missing working directory is a spawn error") {
  ProcessRunner r("sh");
  REQUIRE_THROWS_AS(r.run(sh("true", "/nonexistent/vcsflow/dir")), SpawnError);
}

TEST_CASE("large output on both streams does not deadlock") {
  ProcessRunner r("sh");
  auto res = r.run(sh("i=0; while [ $i -lt 20000 ]; do "
                      "echo 0123456789abcdef; echo fedcba9876543210 1>&2; "
                      "i=$((i+1)); done",
                      mkd("large")));
  REQUIRE(res.success);
  REQUIRE(res.out.size() > 300000);
  REQUIRE(res.err.size() > 300000);
}

TEST_CASE("timeout kills the child") {
  ProcessRunner r("sh");
  auto inv = sh("sleep 10", mkd("timeout"));
  inv.timeout = 200ms;
  auto t0 = std::chrono::steady_clock::now();
  REQUIRE_THROWS_AS(r.run(inv), TimeoutError);
  REQUIRE(std::chrono::steady_clock::now() - t0 < 5s);
}

TEST_CASE("cancellation interrupts a running command") {
  ProcessRunner r("sh");
  auto inv = sh("sleep 10", mkd("cancel"));
  std::thread canceller([tok = inv.cancel] {
    std::this_thread::sleep_for(200ms);
    tok.cancel();
  });
  auto t0 = std::chrono::steady_clock::now();
  REQUIRE_THROWS_AS(r.run(inv), CancelledError);
  canceller.join();
  REQUIRE(std::chrono::steady_clock::now() - t0 < 5s);
}

TEST_CASE("already cancelled token never starts the process") {
  ProcessRunner r("sh");
  auto d = mkd("precancel");
  fs::remove(d / "marker");
  auto inv = sh("touch marker", d);
  inv.cancel.cancel();
  REQUIRE_THROWS_AS(r.run(inv), CancelledError);
  REQUIRE_FALSE(fs::exists(d / "marker"));
}

TEST_CASE("display quoting") {
  REQUIRE(display_args({"commit", "-m", "it's done"}) ==
          "commit -m 'it'\\''s done'");
  REQUIRE(display_args({"log", "--format=%H|%h"}) == "log '--format=%H|%h'");
}

TEST_CASE("trim") {
  REQUIRE(trim("  a b \n") == "a b");
  REQUIRE(trim("\n\t").empty());
}
