#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/resource.h>
#include <linux/close_range.h>
#include <chrono>
#include <sstream>

#include <coderun/process.h>

namespace {

// fallback scan bound when close_range is unavailable
constexpr int kMaxFdScan = 65536;

} // namespace

double MonotonicTimestamp() {
  auto dur = std::chrono::steady_clock::now().time_since_epoch();
  return std::chrono::duration<double>(dur).count();
}

double UnixTimestamp() {
  auto dur = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(dur).count();
}

std::vector<std::string> SplitString(const std::string& str, char delim) {
  std::vector<std::string> ret;
  std::stringstream ss(str);
  for (std::string item; std::getline(ss, item, delim);) {
    item.erase(0, item.find_first_not_of(" \t"));
    item.erase(item.find_last_not_of(" \t") + 1);
    if (item.size()) ret.push_back(std::move(item));
  }
  return ret;
}

int CloexecFrom(int minfd) {
  if (close_range(minfd, ~0U, CLOSE_RANGE_CLOEXEC) == 0) return 0;
  // kernels before 5.11
  struct rlimit lim;
  if (getrlimit(RLIMIT_NOFILE, &lim) < 0) return -1;
  int maxfd = kMaxFdScan;
  if (lim.rlim_cur != RLIM_INFINITY && lim.rlim_cur < (rlim_t)kMaxFdScan) maxfd = lim.rlim_cur;
  for (int fd = minfd; fd < maxfd; fd++) fcntl(fd, F_SETFD, FD_CLOEXEC);
  return 0;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG3(Outcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeToDesc, Outcome, ENUM_OUTCOME_)
#undef X

static const char* kOutcomeAbrTable[] = {
#define X(name, abr, desc) abr,
  ENUM_OUTCOME_
#undef X
};

const char* OutcomeToAbr(Outcome outcome) {
  return kOutcomeAbrTable[(int)outcome];
}

#define X(...) X_RETURN_ARG1(ProcessStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ProcessStatusName, ProcessStatus, ENUM_PROCESS_STATUS_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG3
