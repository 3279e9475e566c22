#include <coderun/process.h>

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <atomic>
#include <cstring>
#include <utility>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

extern char** environ;

namespace {

std::atomic_long spawn_count_seq = 0;

constexpr int kPollIntervalMs = 50;
constexpr size_t kReadChunk = 65536;

class ScopedFd {
  int fd_;
 public:
  ScopedFd() : fd_(-1) {}
  ~ScopedFd() { Close(); }
  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int& Get() { return fd_; }
  int Fd() const { return fd_; }
  void Close() {
    if (fd_ >= 0) close(fd_);
    fd_ = -1;
  }
};

bool MakePipe(ScopedFd& rd, ScopedFd& wr) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) return false;
  rd.Get() = fds[0];
  wr.Get() = fds[1];
  return true;
}

// dup2 clears close-on-exec on the target, except when fd == target
inline bool Redirect(int fd, int target) {
  if (fd == target) return fcntl(fd, F_SETFD, 0) == 0;
  return dup2(fd, target) == target;
}

// between fork and exec; async-signal-safe calls only
[[noreturn]] void ExecChild(int in_fd, int out_fd, int err_fd, int status_fd,
                            char* const* argv, char* const* envp) {
  int err;
  setpgid(0, 0);
  signal(SIGPIPE, SIG_DFL);
  if (!Redirect(in_fd, 0) || !Redirect(out_fd, 1) || !Redirect(err_fd, 2)) goto fail;
  CloexecFrom(3);
  execvpe(argv[0], argv, envp);
fail:
  err = errno;
  IGNORE_RETURN(write(status_fd, &err, sizeof(err)));
  _exit(127);
}

struct Capture {
  size_t limit; // 0 = unlimited
  bool truncated = false;

  void Append(std::string& buf, const char* data, size_t len) {
    if (limit && buf.size() + len > limit) {
      len = limit - buf.size();
      truncated = true;
    }
    buf.append(data, len);
  }
};

// Read what is available; return false on EOF
// Bytes past the limit are still read so the child never blocks on a full pipe
bool ReadSome(ScopedFd& fd, std::string& buf, Capture& cap) {
  char tmp[kReadChunk];
  while (true) {
    ssize_t ret = read(fd.Fd(), tmp, sizeof(tmp));
    if (ret > 0) {
      cap.Append(buf, tmp, ret);
      continue;
    }
    if (ret < 0 && errno == EINTR) continue;
    if (ret < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
    fd.Close();
    return false;
  }
}

// poll the open streams for at most timeout_ms and append what arrives
bool PollOutput(ScopedFd& out, ScopedFd& err, std::string& out_buf, std::string& err_buf,
                Capture& cap, int timeout_ms) {
  struct pollfd fds[2];
  ScopedFd* owners[2];
  std::string* bufs[2];
  nfds_t n = 0;
  for (auto [fd, buf] : {std::make_pair(&out, &out_buf), std::make_pair(&err, &err_buf)}) {
    if (fd->Fd() < 0) continue;
    fds[n].fd = fd->Fd();
    fds[n].events = POLLIN;
    fds[n].revents = 0;
    owners[n] = fd;
    bufs[n++] = buf;
  }
  int ret = poll(n ? fds : nullptr, n, timeout_ms);
  if (ret < 0) return errno == EINTR;
  for (nfds_t i = 0; i < n; i++) {
    if (fds[i].revents) ReadSome(*owners[i], *bufs[i], cap);
  }
  return true;
}

inline bool ChildExited(pid_t pid) {
  siginfo_t info{};
  // WNOWAIT keeps the zombie, so the process group id stays reserved until we reap it
  if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) < 0) return errno == ECHILD;
  return info.si_pid == pid;
}

inline int RemainingMs(double deadline_at) {
  double remaining = deadline_at - MonotonicTimestamp();
  if (remaining <= 0) return 0;
  return std::min<double>(remaining * 1000 + 1, kPollIntervalMs);
}

inline void KillGroup(pid_t pid) {
  kill(-pid, SIGKILL);
  kill(pid, SIGKILL); // in case setpgid did not happen
}

inline int DecodeStatus(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

} // namespace

namespace internal {

long SpawnCount() {
  return spawn_count_seq;
}

} // internal

ProcessResult RunProcess(const ProcessOptions& opt) {
  ProcessResult ret;
  ++spawn_count_seq;
  if (opt.command.empty()) {
    ret.fault = "empty command";
    return ret;
  }
  std::vector<char*> argv, envp;
  for (auto& i : opt.command) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  char* const* envp_ptr = environ;
  if (!opt.preserve_env) {
    for (auto& i : opt.envs) envp.push_back(const_cast<char*>(i.c_str()));
    envp.push_back(nullptr);
    envp_ptr = envp.data();
  }

  ScopedFd null_fd, out_rd, out_wr, err_rd, err_wr, status_rd, status_wr;
  null_fd.Get() = open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (null_fd.Fd() < 0 || !MakePipe(out_rd, out_wr) || !MakePipe(err_rd, err_wr) ||
      !MakePipe(status_rd, status_wr)) {
    ret.fault = fmt::format("cannot create pipes: {}", strerror(errno));
    spdlog::warn("RunProcess error: {}", ret.fault);
    return ret;
  }

  double start = MonotonicTimestamp();
  pid_t pid = fork();
  if (pid < 0) {
    ret.fault = fmt::format("fork failed: {}", strerror(errno));
    spdlog::warn("RunProcess error: {}", ret.fault);
    return ret;
  }
  if (pid == 0) {
    ExecChild(null_fd.Fd(), out_wr.Fd(), err_wr.Fd(), status_wr.Fd(), argv.data(), envp_ptr);
  }
  setpgid(pid, pid); // may race with the child doing the same; both are fine
  ret.pid = pid;
  spdlog::debug("Spawned pid={} command={} deadline={}", pid, fmt::format("{}", opt.command), opt.deadline);
  null_fd.Close();
  out_wr.Close();
  err_wr.Close();
  status_wr.Close();

  // EOF means exec succeeded; otherwise the child reports errno
  {
    int child_errno = 0;
    ssize_t len;
    while ((len = read(status_rd.Fd(), &child_errno, sizeof(child_errno))) < 0 && errno == EINTR);
    if (len == sizeof(child_errno)) {
      int status;
      waitpid(pid, &status, 0);
      ret.elapsed = MonotonicTimestamp() - start;
      ret.fault = fmt::format("cannot execute {}: {}", opt.command[0], strerror(child_errno));
      spdlog::warn("Spawn failed pid={}: {}", pid, ret.fault);
      return ret;
    }
  }
  fcntl(out_rd.Fd(), F_SETFL, O_NONBLOCK);
  fcntl(err_rd.Fd(), F_SETFL, O_NONBLOCK);

  const double deadline_at = start + opt.deadline;
  Capture cap{opt.max_output};
  bool exited = false;
  while (MonotonicTimestamp() < deadline_at) {
    if ((exited = ChildExited(pid))) break;
    if (!PollOutput(out_rd, err_rd, ret.output, ret.error, cap, RemainingMs(deadline_at))) {
      spdlog::warn("poll failed for pid={}: {}", pid, strerror(errno));
      break;
    }
  }

  int status = 0;
  if (!exited) {
    KillGroup(pid);
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR);
    ret.elapsed = MonotonicTimestamp() - start;
    ret.status = ProcessStatus::TIMEOUT;
    ret.exit_code = DecodeStatus(status);
    ret.output.clear();
    ret.error.clear();
    spdlog::info("Process killed after deadline: pid={} elapsed={:.3f}", pid, ret.elapsed);
    return ret;
  }
  // The leader is a zombie now; leftover descendants in its group must not outlive it.
  // Drain what they already wrote until the pipes close or the deadline hits.
  kill(-pid, SIGKILL);
  while ((out_rd.Fd() >= 0 || err_rd.Fd() >= 0) && MonotonicTimestamp() < deadline_at) {
    if (!PollOutput(out_rd, err_rd, ret.output, ret.error, cap, RemainingMs(deadline_at))) break;
  }
  IGNORE_RETURN(PollOutput(out_rd, err_rd, ret.output, ret.error, cap, 0));
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR);
  ret.elapsed = MonotonicTimestamp() - start;
  ret.status = ProcessStatus::EXITED;
  ret.exit_code = DecodeStatus(status);
  ret.truncated = cap.truncated;
  if (cap.truncated) spdlog::info("Output of pid={} truncated to {} bytes per stream", pid, opt.max_output);
  spdlog::debug("Process exited: pid={} exit_code={} elapsed={:.3f} stdout={}B stderr={}B",
                pid, ret.exit_code, ret.elapsed, ret.output.size(), ret.error.size());
  return ret;
}
