#include <catch2/catch_all.hpp>
#include <vcsflow/errors.hpp>
#include <vcsflow/session.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace vcsflow;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

struct Counters {
  std::atomic<int> loads{0};
  std::atomic<int> unloads{0};
  std::atomic<int> in_load{0};
  std::atomic<int> max_in_load{0};
};

class FakeBackend : public AnalysisBackend {
public:
  explicit FakeBackend(Counters &c) : c_(c) {}

  void load(const fs::path &solution) override {
    int now = ++c_.in_load;
    int prev = c_.max_in_load.load();
    while (now > prev && !c_.max_in_load.compare_exchange_weak(prev, now)) {
    }
    std::this_thread::sleep_for(20ms);
    current_ = solution;
    ++c_.loads;
    --c_.in_load;
  }
  void unload() override { ++c_.unloads; }
  std::vector<SymbolLocation> find_symbols(const std::string &name) override {
    return {{name, "class", current_ / "a.cs", 3}};
  }
  std::vector<SymbolLocation> find_references(const std::string &) override {
    return {};
  }
  std::vector<ProjectDependency> dependencies() override { return {}; }

private:
  Counters &c_;
  fs::path current_;
};

} // namespace

TEST_CASE("queries before load are rejected") {
  Counters c;
  AnalysisSession s(std::make_unique<FakeBackend>(c));
  REQUIRE_FALSE(s.is_loaded());
  REQUIRE_THROWS_AS(s.find_symbols("Foo"), ValidationError);
  REQUIRE_THROWS_AS(s.dependencies(), ValidationError);
}

TEST_CASE("load, query, replace and unload") {
  Counters c;
  {
    AnalysisSession s(std::make_unique<FakeBackend>(c));
    s.load("/work/a.sln");
    REQUIRE(s.is_loaded());
    REQUIRE(*s.loaded_path() == fs::path("/work/a.sln"));
    auto syms = s.find_symbols("Foo");
    REQUIRE(syms.size() == 1);
    REQUIRE(syms[0].name == "Foo");

    s.load("/work/b.sln");
    REQUIRE(c.unloads == 1);
    REQUIRE(*s.loaded_path() == fs::path("/work/b.sln"));
  }
  REQUIRE(c.unloads == 2);
}

TEST_CASE("concurrent loads are serialized") {
  Counters c;
  AnalysisSession s(std::make_unique<FakeBackend>(c));
  std::vector<std::thread> ts;
  for (int i = 0; i < 4; ++i)
    ts.emplace_back([&s, i] { s.load(fs::path("/work") / std::to_string(i)); });
  for (auto &t : ts)
    t.join();
  REQUIRE(c.loads == 4);
  REQUIRE(c.max_in_load == 1);
  REQUIRE(s.is_loaded());
}

TEST_CASE("null backend is rejected") {
  REQUIRE_THROWS_AS(AnalysisSession(nullptr), ValidationError);
}
