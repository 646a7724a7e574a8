#include "process.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <cerrno>
#include <chrono>
#include <thread>
#include <climits>
#include <cstring>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

using Clock = std::chrono::steady_clock;

// time allowed to collect the remaining output after the watchdog fires
constexpr auto kDrainGrace = std::chrono::milliseconds(500);
constexpr auto kReapPoll = std::chrono::milliseconds(10);

inline long MsSince(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

inline void CloseFd(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

inline void AppendCapped(std::string& buf, const char* data, size_t len, size_t cap, bool& truncated) {
  if (cap && buf.size() + len > cap) {
    truncated = true;
    len = cap > buf.size() ? cap - buf.size() : 0;
  }
  buf.append(data, len);
}

/// child
// only async-signal-safe calls below
bool SetLimit(int resource, rlim_t soft, rlim_t hard) {
  struct rlimit cur{};
  if (getrlimit(resource, &cur) < 0) return false;
  // an unprivileged process can only lower the hard limit
  if (cur.rlim_max != RLIM_INFINITY && hard > cur.rlim_max) hard = cur.rlim_max;
  if (soft > hard) soft = hard;
  struct rlimit lim{soft, hard};
  return setrlimit(resource, &lim) == 0;
}

bool ApplyLimits(const ProcessOptions& opt) {
  if (!SetLimit(RLIMIT_CORE, 0, 0)) return false; // no core dump
  if (opt.vss && !SetLimit(RLIMIT_AS, opt.vss * 1024, opt.vss * 1024)) return false;
  if (opt.cpu_time && !SetLimit(RLIMIT_CPU, opt.cpu_time, opt.cpu_time + 1)) return false;
  if (opt.file_num && !SetLimit(RLIMIT_NOFILE, opt.file_num, opt.file_num)) return false;
  if (opt.fsize && !SetLimit(RLIMIT_FSIZE, opt.fsize * 1024, opt.fsize * 1024)) return false;
  return true;
}

[[noreturn]] void ChildFail(int fd) {
  int err = errno;
  IGNORE_RETURN(write(fd, &err, sizeof(err)));
  _exit(127);
}

} // namespace

ProcessResult RunProcess(const ProcessOptions& opt) {
  ProcessResult ret;
  if (opt.command.empty()) {
    ret.error = "empty command";
    return ret;
  }
  // everything the child touches is prepared before fork
  std::vector<char*> argv, envp;
  for (auto& i : opt.command) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  for (auto& i : opt.envs) envp.push_back(const_cast<char*>(i.c_str()));
  envp.push_back(nullptr);
  char* const* child_env = opt.preserve_env ? environ : envp.data();

  // O_CLOEXEC so that concurrently spawned children never inherit our pipes
  int out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, exec_pipe[2] = {-1, -1};
  if (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 ||
      pipe2(exec_pipe, O_CLOEXEC) < 0) {
    ret.error = fmt::format("pipe: {}", strerror(errno));
    for (int* p : {out_pipe, err_pipe, exec_pipe}) CloseFd(p[0]), CloseFd(p[1]);
    spdlog::warn("RunProcess error: {}", ret.error);
    return ret;
  }
  spdlog::debug("RunProcess command={} wall_time={}", fmt::format("{}", opt.command), opt.wall_time);

  auto start = Clock::now();
  pid_t pid = fork();
  if (pid < 0) {
    ret.error = fmt::format("fork: {}", strerror(errno));
    for (int* p : {out_pipe, err_pipe, exec_pipe}) CloseFd(p[0]), CloseFd(p[1]);
    spdlog::warn("RunProcess error: {}", ret.error);
    return ret;
  }
  if (pid == 0) {
    if (opt.new_group) setpgid(0, 0);
    int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd < 0 || dup2(null_fd, 0) < 0 ||
        dup2(out_pipe[1], 1) < 0 || dup2(err_pipe[1], 2) < 0) {
      ChildFail(exec_pipe[1]);
    }
    if (!opt.workdir.empty() && chdir(opt.workdir.c_str()) < 0) ChildFail(exec_pipe[1]);
    if (!ApplyLimits(opt)) ChildFail(exec_pipe[1]);
    execvpe(argv[0], argv.data(), child_env);
    ChildFail(exec_pipe[1]);
  }
  // also set from the parent so a kill cannot race the child's own setpgid
  if (opt.new_group) setpgid(pid, pid);
  CloseFd(out_pipe[1]);
  CloseFd(err_pipe[1]);
  CloseFd(exec_pipe[1]);

  // exec_pipe is closed by a successful exec; otherwise the child reports errno
  int child_errno = 0;
  ssize_t n;
  while ((n = read(exec_pipe[0], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR);
  CloseFd(exec_pipe[0]);
  if (n == sizeof(child_errno)) {
    while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR);
    CloseFd(out_pipe[0]);
    CloseFd(err_pipe[0]);
    ret.error = fmt::format("cannot execute {}: {}", opt.command[0], strerror(child_errno));
    spdlog::warn("RunProcess error: {}", ret.error);
    return ret;
  }
  ret.started = true;

  const auto deadline = opt.wall_time > 0 ?
      start + std::chrono::milliseconds(opt.wall_time) : Clock::time_point::max();
  auto drain_until = Clock::time_point::max();
  auto KillChild = [&]() {
    if (ret.timed_out) return;
    spdlog::debug("Process pid={} exceeded {} ms, killing", pid, opt.wall_time);
    kill(opt.new_group ? -pid : pid, SIGKILL);
    ret.timed_out = true;
  };

  int fds[2] = {out_pipe[0], err_pipe[0]};
  std::string* bufs[2] = {&ret.stdout_data, &ret.stderr_data};
  while (fds[0] >= 0 || fds[1] >= 0) {
    auto now = Clock::now();
    if (!ret.timed_out && now >= deadline) {
      KillChild();
      drain_until = now + kDrainGrace;
    }
    if (ret.timed_out && now >= drain_until) break;
    int timeout_ms = -1;
    auto wake = ret.timed_out ? drain_until : deadline;
    if (wake != Clock::time_point::max()) {
      long diff = std::chrono::duration_cast<std::chrono::milliseconds>(wake - now).count();
      timeout_ms = (int)std::clamp<long>(diff + 1, 0, INT_MAX);
    }
    struct pollfd pfds[2];
    int idx[2];
    nfds_t nfds = 0;
    for (int i = 0; i < 2; i++) {
      if (fds[i] < 0) continue;
      pfds[nfds] = {fds[i], POLLIN, 0};
      idx[nfds++] = i;
    }
    int r = poll(pfds, nfds, timeout_ms);
    if (r < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("poll error: {}", strerror(errno));
      break;
    }
    for (nfds_t j = 0; j < nfds; j++) {
      if (!pfds[j].revents) continue;
      int i = idx[j];
      char buf[65536];
      ssize_t len = read(fds[i], buf, sizeof(buf));
      if (len < 0 && errno == EINTR) continue;
      if (len <= 0) {
        CloseFd(fds[i]);
        continue;
      }
      AppendCapped(*bufs[i], buf, len, opt.max_output, ret.truncated);
    }
  }
  CloseFd(fds[0]);
  CloseFd(fds[1]);

  // the process may have closed its stdio and still be running
  while (true) {
    siginfo_t info{};
    if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (info.si_pid == pid) break;
    if (Clock::now() >= deadline) KillChild();
    std::this_thread::sleep_for(kReapPoll);
  }
  // take down anything left in the group before the leader is reaped
  if (opt.new_group) kill(-pid, SIGKILL);
  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR);
  ret.wall_time = MsSince(start);
  if (WIFEXITED(status)) {
    ret.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    ret.signal = WTERMSIG(status);
  }
  spdlog::debug("Process pid={} finished: exit={} signal={} timed_out={} time={}ms",
                pid, ret.exit_code, ret.signal, ret.timed_out, ret.wall_time);
  return ret;
}
