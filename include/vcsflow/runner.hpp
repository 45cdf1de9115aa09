#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace vcsflow {

class CancelToken {
public:
  CancelToken() : flag_(std::make_shared<std::atomic_bool>(false)) {}

  void cancel() const { flag_->store(true); }
  bool cancelled() const { return flag_->load(); }
  void throw_if_cancelled() const;

private:
  std::shared_ptr<std::atomic_bool> flag_;
};

struct Invocation {
  std::vector<std::string> args; // without the binary
  std::filesystem::path cwd;
  std::unordered_map<std::string, std::string> env;
  CancelToken cancel;
  std::chrono::milliseconds timeout{0};
};

struct CommandResult {
  bool success{false};
  int exit_code{-1};
  std::string out;
  std::string err;
};

// Shell-quoted rendering for logs only; never executed.
std::string display_args(const std::vector<std::string> &args);

std::string trim(const std::string &s);

class CommandRunner {
public:
  virtual ~CommandRunner() = default;
  virtual CommandResult run(const Invocation &inv) = 0;
};

// fork/exec runner. Throws SpawnError, CancelledError, TimeoutError;
// a non-zero exit is a regular result.
class ProcessRunner : public CommandRunner {
public:
  explicit ProcessRunner(std::string binary = "git")
      : binary_(std::move(binary)) {}

  CommandResult run(const Invocation &inv) override;

  const std::string &binary() const { return binary_; }

private:
  std::string binary_;
};

} // namespace vcsflow
