// File: src/core/exec/process_runner.cpp
#include "runbox/core/exec/process_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace runbox {
namespace {

using clock = std::chrono::steady_clock;

// Records the child writes to the status pipe before exec.
struct ChildReport {
  char kind;   // 'W' = warning (continue), 'E' = fatal (child exits)
  int step;
  int err;
};

enum ChildStep : int {
  kStepCpuLimit = 1,
  kStepMemoryLimit = 2,
  kStepChdir = 3,
  kStepExec = 4,
  kStepStdin = 5,
};

const char* step_name(int step) {
  switch (step) {
    case kStepCpuLimit: return "RLIMIT_CPU";
    case kStepMemoryLimit: return "RLIMIT_AS";
    case kStepChdir: return "chdir";
    case kStepExec: return "exec";
    case kStepStdin: return "stdin redirect";
    default: return "child setup";
  }
}

struct Pipe {
  int fds[2] = {-1, -1};

  bool open() { return ::pipe2(fds, O_CLOEXEC) == 0; }
  void close_read() {
    if (fds[0] != -1) ::close(fds[0]);
    fds[0] = -1;
  }
  void close_write() {
    if (fds[1] != -1) ::close(fds[1]);
    fds[1] = -1;
  }
  ~Pipe() {
    close_read();
    close_write();
  }
};

// Only async-signal-safe calls from here until exec.
[[noreturn]] void run_child(const SpawnRequest& req, char* const* argv, int out_fd, int err_fd,
                            int status_fd) {
  auto report = [status_fd](char kind, int step, int err) {
    const ChildReport r{kind, step, err};
    ssize_t n;
    do {
      n = ::write(status_fd, &r, sizeof(r));
    } while (n < 0 && errno == EINTR);
  };

  ::setpgid(0, 0);

  const int devnull = ::open("/dev/null", O_RDONLY);
  if (devnull < 0 || ::dup2(devnull, STDIN_FILENO) < 0) report('W', kStepStdin, errno);
  if (devnull > STDIN_FILENO) ::close(devnull);

  if (::dup2(out_fd, STDOUT_FILENO) < 0 || ::dup2(err_fd, STDERR_FILENO) < 0) {
    report('E', kStepExec, errno);
    ::_exit(127);
  }

  if (!req.working_dir.empty() && ::chdir(req.working_dir.c_str()) != 0) {
    report('E', kStepChdir, errno);
    ::_exit(127);
  }

  if (req.limits.cpu_seconds > 0) {
    struct rlimit rl{};
    rl.rlim_cur = static_cast<rlim_t>(req.limits.cpu_seconds);
    rl.rlim_max = static_cast<rlim_t>(req.limits.cpu_seconds + req.limits.cpu_grace_seconds);
    if (::setrlimit(RLIMIT_CPU, &rl) != 0) report('W', kStepCpuLimit, errno);
  }
  if (req.limits.memory_bytes > 0) {
    struct rlimit rl{};
    rl.rlim_cur = static_cast<rlim_t>(req.limits.memory_bytes);
    rl.rlim_max = static_cast<rlim_t>(req.limits.memory_bytes);
    if (::setrlimit(RLIMIT_AS, &rl) != 0) report('W', kStepMemoryLimit, errno);
  }

  ::execvp(argv[0], argv);
  report('E', kStepExec, errno);
  ::_exit(127);
}

void append_capped(std::string& dst, const char* buf, std::size_t n, std::size_t cap) {
  if (cap == 0) {
    dst.append(buf, n);
    return;
  }
  if (dst.size() >= cap) return;
  dst.append(buf, std::min(n, cap - dst.size()));
}

// Reads what is available. Returns false once the pipe reached EOF or failed.
bool drain(int fd, std::string& dst, std::size_t cap) {
  char buf[8192];
  while (true) {
    const ssize_t r = ::read(fd, buf, sizeof(buf));
    if (r > 0) {
      append_capped(dst, buf, static_cast<std::size_t>(r), cap);
      continue;
    }
    if (r == 0) return false;
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
    return false;
  }
}

int decode_exit(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return -WTERMSIG(status);
  return -1;
}

pid_t wait_blocking(pid_t pid, int* status) {
  pid_t r;
  do {
    r = ::waitpid(pid, status, 0);
  } while (r < 0 && errno == EINTR);
  return r;
}

void kill_group(pid_t pid) {
  ::kill(-pid, SIGKILL);
  ::kill(pid, SIGKILL);  // in case setpgid did not take effect
}

}  // namespace

SpawnResult PosixProcessRunner::spawn(const SpawnRequest& req) {
  SpawnResult res;

  if (req.executable.empty()) {
    res.launch_error = "empty executable";
    return res;
  }
  if (req.timeout.count() <= 0) {
    res.launch_error = "timeout must be > 0";
    return res;
  }

  std::vector<std::string> argv_storage;
  argv_storage.reserve(req.args.size() + 1);
  argv_storage.push_back(req.executable);
  argv_storage.insert(argv_storage.end(), req.args.begin(), req.args.end());
  std::vector<char*> argv;
  argv.reserve(argv_storage.size() + 1);
  for (auto& a : argv_storage) argv.push_back(a.data());
  argv.push_back(nullptr);

  Pipe out, err, status;
  if (!out.open() || !err.open() || !status.open()) {
    res.launch_error = std::string("pipe failed: ") + std::strerror(errno);
    return res;
  }

  const auto start = clock::now();
  const auto deadline = start + req.timeout;

  const pid_t pid = ::fork();
  if (pid < 0) {
    res.launch_error = std::string("fork failed: ") + std::strerror(errno);
    return res;
  }
  if (pid == 0) {
    run_child(req, argv.data(), out.fds[1], err.fds[1], status.fds[1]);
  }

  // Also set from the parent so a kill can never miss the group.
  ::setpgid(pid, pid);

  out.close_write();
  err.close_write();
  status.close_write();

  // The status pipe closes on exec (O_CLOEXEC) or when the child exits.
  ChildReport rep{};
  while (true) {
    const ssize_t n = ::read(status.fds[0], &rep, sizeof(rep));
    if (n < 0 && errno == EINTR) continue;
    if (n != static_cast<ssize_t>(sizeof(rep))) break;

    const std::string what = std::string(step_name(rep.step)) + ": " + std::strerror(rep.err);
    if (rep.kind == 'W') {
      res.warnings.push_back("failed to apply " + what);
      spdlog::warn("child {}: failed to apply {}", pid, what);
    } else {
      res.launch_error = what;
    }
  }
  status.close_read();

  if (!res.launch_error.empty()) {
    int st = 0;
    wait_blocking(pid, &st);
    res.state = SpawnResult::State::kLaunchError;
    return res;
  }

  ::fcntl(out.fds[0], F_SETFL, ::fcntl(out.fds[0], F_GETFL, 0) | O_NONBLOCK);
  ::fcntl(err.fds[0], F_SETFL, ::fcntl(err.fds[0], F_GETFL, 0) | O_NONBLOCK);

  bool out_open = true;
  bool err_open = true;
  bool timed_out = false;

  while (out_open || err_open) {
    const auto now = clock::now();
    if (now >= deadline) {
      timed_out = true;
      break;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count() + 1;

    struct pollfd fds[2];
    nfds_t nfds = 0;
    if (out_open) fds[nfds++] = {out.fds[0], POLLIN, 0};
    if (err_open) fds[nfds++] = {err.fds[0], POLLIN, 0};

    const int ready = ::poll(fds, nfds, static_cast<int>(remaining));
    if (ready < 0) {
      if (errno == EINTR) continue;
      spdlog::error("poll failed for child {}: {}", pid, std::strerror(errno));
      break;
    }
    for (nfds_t i = 0; i < nfds; ++i) {
      if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      if (fds[i].fd == out.fds[0]) out_open = drain(out.fds[0], res.stdout_text, req.max_capture_bytes);
      else err_open = drain(err.fds[0], res.stderr_text, req.max_capture_bytes);
    }
  }

  // Streams are closed; the child may still be running. WNOWAIT leaves an
  // exited child unreaped so its pid, and with it the group id, stays ours
  // until the group kill below.
  int st = 0;
  while (!timed_out) {
    siginfo_t info{};
    const int r = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
    if (r < 0 && errno == EINTR) continue;
    if (r < 0) {
      res.launch_error = std::string("waitid failed: ") + std::strerror(errno);
      res.state = SpawnResult::State::kLaunchError;
      kill_group(pid);
      wait_blocking(pid, &st);
      return res;
    }
    if (info.si_pid == pid) break;
    if (clock::now() >= deadline) {
      timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  if (timed_out) {
    kill_group(pid);
    wait_blocking(pid, &st);
    // Keep whatever the child wrote before it died.
    if (out_open) drain(out.fds[0], res.stdout_text, req.max_capture_bytes);
    if (err_open) drain(err.fds[0], res.stderr_text, req.max_capture_bytes);
    res.state = SpawnResult::State::kTimedOut;
    spdlog::warn("child {} ({}) killed after {} ms wall clock", pid, req.executable, req.timeout.count());
    return res;
  }

  // Background jobs the child left behind go with it.
  ::kill(-pid, SIGKILL);
  if (wait_blocking(pid, &st) != pid) {
    res.launch_error = std::string("waitpid failed: ") + std::strerror(errno);
    res.state = SpawnResult::State::kLaunchError;
    return res;
  }

  res.state = SpawnResult::State::kExited;
  res.exit_code = decode_exit(st);
  spdlog::debug("child {} ({}) exited with {}", pid, req.executable, res.exit_code);
  return res;
}

}  // namespace runbox
