#include <trainer/process.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <atomic>
#include <mutex>
#include <vector>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "internal.h"

namespace {

// granularity of deadline & cancellation checks
constexpr int kPollIntervalMs = 50;
constexpr size_t kReadChunk = 65536;

void IgnoreSigpipe() {
  // a child may exit without reading its whole input
  static std::once_flag flag;
  std::call_once(flag, []() { signal(SIGPIPE, SIG_IGN); });
}

inline long ElapsedUs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start).count();
}

void ClosePipe(int fds[2]) {
  for (int i = 0; i < 2; i++) {
    if (fds[i] >= 0) close(fds[i]);
    fds[i] = -1;
  }
}

/// child; only async-signal-safe calls from here on
[[noreturn]] void ExecChild(char* const* argv, const ExecOptions& opt,
                            int in_fd, int out_fd, int err_fd, int status_fd) {
  setpgid(0, 0);
  signal(SIGPIPE, SIG_DFL);
  if (dup2(in_fd, 0) >= 0 && dup2(out_fd, 1) >= 0 && dup2(err_fd, 2) >= 0 &&
      (opt.workdir.empty() || chdir(opt.workdir.c_str()) >= 0)) {
    execvp(argv[0], argv);
  }
  // status_fd is close-on-exec, so the parent reads nothing on success
  int err = errno;
  IGNORE_RETURN(write(status_fd, &err, sizeof(err)));
  _exit(127);
}

std::atomic_bool signal_cancel(false);

void OnCancelSignal(int) {
  signal_cancel = true;
}

} // namespace

std::atomic_bool* CancelOnSignals() {
  struct sigaction sa{};
  sa.sa_handler = OnCancelSignal;
  sigemptyset(&sa.sa_mask);
  for (int sig : {SIGINT, SIGTERM}) {
    if (sigaction(sig, &sa, nullptr) < 0) {
      spdlog::warn("Failed installing handler for signal {}: {}", sig, strerror(errno));
    }
  }
  return &signal_cancel;
}

ExecResult Execute(const ExecOptions& opt) {
  ExecResult ret;
  if (opt.command.empty()) {
    ret.error = EINVAL;
    return ret;
  }
  IgnoreSigpipe();
  std::vector<char*> argv;
  for (auto& i : opt.command) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  int inpipe[2] = {-1, -1}, outpipe[2] = {-1, -1}, errpipe[2] = {-1, -1}, statpipe[2] = {-1, -1};
  if (pipe2(inpipe, O_CLOEXEC) < 0 || pipe2(outpipe, O_CLOEXEC) < 0 ||
      pipe2(errpipe, O_CLOEXEC) < 0 || pipe2(statpipe, O_CLOEXEC) < 0) {
    ret.error = errno;
    ClosePipe(inpipe), ClosePipe(outpipe), ClosePipe(errpipe), ClosePipe(statpipe);
    spdlog::warn("Execute error: pipe failed: {}", strerror(ret.error));
    return ret;
  }
  auto start = std::chrono::steady_clock::now();
  pid_t pid = fork();
  if (pid < 0) {
    ret.error = errno;
    ClosePipe(inpipe), ClosePipe(outpipe), ClosePipe(errpipe), ClosePipe(statpipe);
    spdlog::warn("Execute error: fork failed: {}", strerror(ret.error));
    return ret;
  }
  if (pid == 0) ExecChild(argv.data(), opt, inpipe[0], outpipe[1], errpipe[1], statpipe[1]);
  // avoid racing with the child's own setpgid before we signal the group
  setpgid(pid, pid);
  spdlog::debug("Execute pid={} command={} workdir={} input_bytes={}",
                pid, fmt::format("{}", opt.command), opt.workdir, opt.input.size());
  close(inpipe[0]);
  close(outpipe[1]);
  close(errpipe[1]);
  close(statpipe[1]);
  {
    // blocks until the child execs or reports why it could not
    int child_errno = 0;
    ssize_t n;
    while ((n = read(statpipe[0], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR);
    close(statpipe[0]);
    if (n == (ssize_t)sizeof(child_errno)) {
      ret.error = child_errno;
      close(inpipe[1]);
      close(outpipe[0]);
      close(errpipe[0]);
      while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR);
      spdlog::warn("Execute error: cannot execute {}: {}", opt.command[0], strerror(ret.error));
      return ret;
    }
  }
  int in_fd = inpipe[1], out_fd = outpipe[0], err_fd = errpipe[0];
  fcntl(in_fd, F_SETFL, fcntl(in_fd, F_GETFL) | O_NONBLOCK);
  if (opt.input.empty()) {
    close(in_fd);
    in_fd = -1;
  }

  const size_t output_cap = opt.max_output > 0 ? (size_t)opt.max_output * 1024 : 0;
  size_t written = 0;
  char buf[kReadChunk];
  bool killed = false;
  auto Kill = [&]() {
    if (!killed) kill(-pid, SIGKILL);
    killed = true;
  };

  while (out_fd >= 0 || err_fd >= 0) {
    if (opt.cancel && opt.cancel->load()) {
      ret.cancelled = true;
      Kill();
    }
    int timeout = kPollIntervalMs;
    if (opt.wall_time > 0 && !killed) {
      long remain = opt.wall_time - ElapsedUs(start);
      if (remain <= 0) {
        ret.timed_out = true;
        Kill();
      } else if (remain / 1000 < timeout) {
        timeout = remain / 1000 + 1;
      }
    }
    struct pollfd fds[3];
    int nfds = 0;
    if (in_fd >= 0 && !killed) fds[nfds++] = {in_fd, POLLOUT, 0};
    if (out_fd >= 0) fds[nfds++] = {out_fd, POLLIN, 0};
    if (err_fd >= 0) fds[nfds++] = {err_fd, POLLIN, 0};
    if (poll(fds, nfds, timeout) < 0) {
      if (errno == EINTR) continue;
      ret.error = errno;
      Kill();
      break;
    }
    for (int i = 0; i < nfds; i++) {
      if (!fds[i].revents) continue;
      int fd = fds[i].fd;
      if (fd == in_fd) {
        ssize_t n = write(in_fd, opt.input.data() + written, opt.input.size() - written);
        if (n > 0) written += n;
        if ((n < 0 && errno != EAGAIN) || written == opt.input.size()) {
          close(in_fd);
          in_fd = -1;
        }
        continue;
      }
      ssize_t n = read(fd, buf, sizeof(buf));
      if (n < 0 && (errno == EAGAIN || errno == EINTR)) continue;
      if (n <= 0) {
        close(fd);
        (fd == out_fd ? out_fd : err_fd) = -1;
        continue;
      }
      std::string& target = fd == out_fd ? ret.output : ret.error_output;
      if (output_cap && target.size() + n > output_cap) {
        target.append(buf, output_cap - target.size());
        ret.output_exceeded = true;
        Kill();
      } else {
        target.append(buf, n);
      }
    }
  }
  if (in_fd >= 0) close(in_fd);

  int status = 0;
  while (true) {
    pid_t res = waitpid(pid, &status, WNOHANG);
    if (res == pid) break;
    if (res < 0) {
      if (errno == EINTR) continue;
      ret.error = errno;
      spdlog::warn("Execute error: waitpid failed: {}", strerror(ret.error));
      return ret;
    }
    // the child closed its output but has not exited yet
    if (opt.cancel && opt.cancel->load()) {
      ret.cancelled = true;
      Kill();
    }
    if (opt.wall_time > 0 && !killed && ElapsedUs(start) >= opt.wall_time) {
      ret.timed_out = true;
      Kill();
    }
    poll(nullptr, 0, kPollIntervalMs);
  }
  // collect grandchildren that may still hold the group
  if (killed) kill(-pid, SIGKILL);
  ret.wall_time = ElapsedUs(start);
  if (WIFEXITED(status)) {
    ret.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    ret.signal = WTERMSIG(status);
    ret.exit_code = 128 + ret.signal;
  }
  spdlog::debug("Execute finished pid={} exit_code={} signal={} timed_out={} output_exceeded={} time={}",
                pid, ret.exit_code, ret.signal, ret.timed_out, ret.output_exceeded, ret.wall_time);
  return ret;
}
