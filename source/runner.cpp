#include <vcsflow/errors.hpp>
#include <vcsflow/runner.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace vcsflow {

void CancelToken::throw_if_cancelled() const {
  if (cancelled())
    throw CancelledError();
}

std::string display_args(const std::vector<std::string> &args) {
  std::ostringstream oss;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i)
      oss << ' ';
    const auto &a = args[i];
    bool plain = !a.empty();
    for (char c : a) {
      if (!(std::isalnum(static_cast<unsigned char>(c)) ||
            std::strchr("-_./=:@%+,{}^~", c))) {
        plain = false;
        break;
      }
    }
    if (plain) {
      oss << a;
      continue;
    }
    oss << '\'';
    for (char c : a) {
      if (c == '\'')
        oss << "'\\''";
      else
        oss << c;
    }
    oss << '\'';
  }
  return oss.str();
}

std::string trim(const std::string &s) {
  size_t i = 0, j = s.size();
  while (i < j && std::isspace(static_cast<unsigned char>(s[i])))
    ++i;
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1])))
    --j;
  return s.substr(i, j - i);
}

static int make_cloexec_pipe(int pfd[2]) {
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) == 0)
    return 0;
#endif
  if (::pipe(pfd) != 0)
    return -1;
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
  return 0;
}

static void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

static int decode_status(int st) {
  if (WIFEXITED(st))
    return WEXITSTATUS(st);
  if (WIFSIGNALED(st))
    return 128 + WTERMSIG(st);
  return -1;
}

// Kills the child's whole process group so helpers spawned by git go too.
static void kill_tree(pid_t pid) {
  ::kill(-pid, SIGKILL);
  ::kill(pid, SIGKILL);
  int st = 0;
  while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {
  }
}

CommandResult ProcessRunner::run(const Invocation &inv) {
  inv.cancel.throw_if_cancelled();

  std::error_code ec;
  if (inv.cwd.empty() || !fs::is_directory(inv.cwd, ec))
    throw SpawnError(
        fmt::format("working directory does not exist: {}", inv.cwd.string()));

  spdlog::debug("[git] run: {} {} in {}", binary_, display_args(inv.args),
                inv.cwd.string());

  int out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, exec_pipe[2] = {-1, -1};
  if (make_cloexec_pipe(out_pipe) != 0 || make_cloexec_pipe(err_pipe) != 0 ||
      make_cloexec_pipe(exec_pipe) != 0) {
    int e = errno;
    for (int *p : {out_pipe, err_pipe, exec_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    throw SpawnError(fmt::format("pipe failed: {}", std::strerror(e)));
  }

  std::vector<char *> argv;
  argv.reserve(inv.args.size() + 2);
  argv.push_back(const_cast<char *>(binary_.c_str()));
  for (auto &s : inv.args)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    int e = errno;
    for (int *p : {out_pipe, err_pipe, exec_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    throw SpawnError(fmt::format("fork failed: {}", std::strerror(e)));
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    ::close(exec_pipe[0]);
    int err = 0;
    if (::chdir(inv.cwd.c_str()) != 0) {
      err = errno;
      (void)!::write(exec_pipe[1], &err, sizeof(err));
      _exit(127);
    }
    for (auto &[k, v] : inv.env)
      ::setenv(k.c_str(), v.c_str(), 1);

    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);

    ::execvp(argv[0], argv.data());

    err = errno;
    (void)!::write(exec_pipe[1], &err, sizeof(err));
    _exit(127);
  }

  ::setpgid(pid, pid);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(exec_pipe[0]);

  if (n > 0) {
    int st = 0;
    ::waitpid(pid, &st, 0);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    spdlog::warn("[git] spawn failed: {} ({})", binary_,
                 std::strerror(child_errno));
    throw SpawnError(fmt::format("cannot start '{}': {}", binary_,
                                 std::strerror(child_errno)));
  }

  using clock = std::chrono::steady_clock;
  const bool has_deadline = inv.timeout.count() > 0;
  const auto deadline = clock::now() + inv.timeout;

  auto interrupt_if_needed = [&]() {
    if (inv.cancel.cancelled()) {
      spdlog::warn("[git] cancelled: {} {} (pid={})", binary_,
                   display_args(inv.args), pid);
      kill_tree(pid);
      close_fd(out_pipe[0]);
      close_fd(err_pipe[0]);
      throw CancelledError();
    }
    if (has_deadline && clock::now() >= deadline) {
      spdlog::warn("[git] timeout after {}ms: {} {} (pid={})",
                   inv.timeout.count(), binary_, display_args(inv.args), pid);
      kill_tree(pid);
      close_fd(out_pipe[0]);
      close_fd(err_pipe[0]);
      throw TimeoutError(fmt::format("'{} {}' timed out after {}ms", binary_,
                                     display_args(inv.args),
                                     inv.timeout.count()));
    }
  };

  CommandResult res{};
  std::array<char, 4096> buf{};

  // Both streams are drained together: a child blocked on a full stderr pipe
  // would otherwise never close stdout.
  while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
    interrupt_if_needed();

    std::array<pollfd, 2> pfds{};
    nfds_t cnt = 0;
    int *owners[2] = {nullptr, nullptr};
    std::string *sinks[2] = {nullptr, nullptr};
    if (out_pipe[0] >= 0) {
      pfds[cnt] = pollfd{out_pipe[0], POLLIN, 0};
      owners[cnt] = &out_pipe[0];
      sinks[cnt] = &res.out;
      ++cnt;
    }
    if (err_pipe[0] >= 0) {
      pfds[cnt] = pollfd{err_pipe[0], POLLIN, 0};
      owners[cnt] = &err_pipe[0];
      sinks[cnt] = &res.err;
      ++cnt;
    }

    int pr = ::poll(pfds.data(), cnt, 50);
    if (pr < 0) {
      if (errno == EINTR)
        continue;
      int e = errno;
      kill_tree(pid);
      close_fd(out_pipe[0]);
      close_fd(err_pipe[0]);
      throw SpawnError(fmt::format("poll failed: {}", std::strerror(e)));
    }
    if (pr == 0)
      continue;

    for (nfds_t i = 0; i < cnt; ++i) {
      if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR)))
        continue;
      ssize_t r = ::read(*owners[i], buf.data(), buf.size());
      if (r > 0) {
        sinks[i]->append(buf.data(), static_cast<size_t>(r));
      } else if (r == 0 || errno != EINTR) {
        close_fd(*owners[i]);
      }
    }
  }

  int st = 0;
  bool reaped = false;
  for (;;) {
    pid_t w = ::waitpid(pid, &st, WNOHANG);
    if (w == pid) {
      reaped = true;
      break;
    }
    if (w < 0 && errno != EINTR)
      break;
    interrupt_if_needed();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  res.exit_code = reaped ? decode_status(st) : -1;
  res.success = res.exit_code == 0;
  res.out = trim(res.out);
  res.err = trim(res.err);

  if (!res.success)
    spdlog::debug("[git] exit={} err={}", res.exit_code, res.err);
  return res;
}

} // namespace vcsflow
