#ifndef INCLUDE_CODERUN_PROCESS_H_
#define INCLUDE_CODERUN_PROCESS_H_

#include <string>
#include <vector>
#include <sys/types.h>

#define ENUM_PROCESS_STATUS_ \
  X(EXITED) \
  X(TIMEOUT) \
  X(SPAWN_FAULT)
enum class ProcessStatus {
#define X(name) name,
  ENUM_PROCESS_STATUS_
#undef X
};

class ProcessOptions {
 public:
  std::vector<std::string> command; // argv; command[0] is looked up in PATH
  bool preserve_env; // inherit the environment of this process; ignores envs
  std::vector<std::string> envs; // NAME=VALUE
  double deadline; // seconds of wall-clock time
  size_t max_output; // bytes kept per stream; 0 = unlimited

  ProcessOptions() : preserve_env(false), deadline(0), max_output(0) {}
};

struct ProcessResult {
  ProcessStatus status;
  pid_t pid; // -1 if never started
  int exit_code; // 128 + signal if killed by a signal
  double elapsed; // seconds
  std::string output, error; // captured stdout & stderr; empty on TIMEOUT
  bool truncated; // some output was dropped because of max_output
  std::string fault; // reason of SPAWN_FAULT

  ProcessResult() :
      status(ProcessStatus::SPAWN_FAULT), pid(-1), exit_code(-1), elapsed(0), truncated(false) {}
};

namespace internal {

// number of spawn attempts since startup; for testing
long SpawnCount();

} // internal

// Blocks until the child exits or the deadline elapses.
// On deadline, the child's whole process group is killed and reaped before returning.
ProcessResult RunProcess(const ProcessOptions&);

const char* ProcessStatusName(ProcessStatus);

#endif  // INCLUDE_CODERUN_PROCESS_H_
