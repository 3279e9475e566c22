#include <coderun/gate.h>

#include <cstdlib>
#include <mutex>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <coderun/process.h>
#include <coderun/exec_unit.h>

extern char** environ;

std::string kInterpreter = "python3";
double kRunDeadline = 30;
double kInstallDeadline = 120;
bool kInheritEnv = false;
std::vector<std::string> kEnvAllowlist = {
  "PATH", "HOME", "LANG", "LC_ALL", "LC_CTYPE", "TMPDIR",
  "PYTHONPATH", "PYTHONHOME", "PYTHONIOENCODING", "VIRTUAL_ENV",
};
size_t kMaxOutput = 0;

namespace {

constexpr double kVersionDeadline = 10;

inline bool IsPackageChar(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
         c == '-' || c == '_' || c == '.' || c == '[' || c == ']';
}

// Fold a finished process into the shape reported to clients
ExecutionResult FromProcess(ProcessResult&& res, const std::string& timeout_message) {
  switch (res.status) {
    case ProcessStatus::EXITED: {
      ExecutionResult ret;
      ret.success = res.exit_code == 0;
      ret.outcome = ret.success ? Outcome::OK : Outcome::NONZERO_EXIT;
      ret.output = std::move(res.output);
      ret.errors = std::move(res.error);
      return ret;
    }
    case ProcessStatus::TIMEOUT: return ExecutionResult(Outcome::TIMEOUT, timeout_message);
    case ProcessStatus::SPAWN_FAULT: return ServerError("Spawn", res.fault);
  }
  __builtin_unreachable();
}

ExecutionResult RunCodeImpl(const RunRequest& req) {
  ExecutionUnit unit(req.code);
  ProcessOptions opt;
  opt.command = {kInterpreter, unit.Path()};
  opt.preserve_env = kInheritEnv;
  if (!kInheritEnv) opt.envs = ChildEnvironment();
  opt.deadline = kRunDeadline;
  opt.max_output = kMaxOutput;
  // RunProcess reaps the child on every status, so the unit outlives it
  return FromProcess(RunProcess(opt), fmt::format(
      "Execution timeout: Code took longer than {:g} seconds to execute", kRunDeadline));
}

ExecutionResult InstallPackageImpl(const InstallRequest& req) {
  ProcessOptions opt;
  opt.command = {kInterpreter, "-m", "pip", "install", req.package};
  opt.preserve_env = kInheritEnv;
  if (!kInheritEnv) opt.envs = ChildEnvironment();
  opt.deadline = kInstallDeadline;
  opt.max_output = kMaxOutput;
  return FromProcess(RunProcess(opt), fmt::format(
      "Installation timeout: Package installation took longer than {:g} seconds", kInstallDeadline));
}

} // namespace

bool ValidatePackageName(const std::string& name) {
  if (name.empty() || name[0] == '-') return false;
  for (char c : name) {
    if (!IsPackageChar(c)) return false;
  }
  return true;
}

ExecutionResult RunCode(const RunRequest& req) {
  if (req.code.empty()) return ExecutionResult(Outcome::VALIDATION_FAILED, "No code provided");
  return FaultBoundary("Run", [&req]() { return RunCodeImpl(req); });
}

ExecutionResult InstallPackage(const InstallRequest& req) {
  if (req.package.empty()) return ExecutionResult(Outcome::VALIDATION_FAILED, "No package name provided");
  if (!ValidatePackageName(req.package)) {
    spdlog::info("Rejected package name: '{}'", req.package);
    return ExecutionResult(Outcome::VALIDATION_FAILED,
        "Invalid package name. Only alphanumeric characters, hyphens, underscores, dots, "
        "and brackets are allowed.");
  }
  return FaultBoundary("Install", [&req]() { return InstallPackageImpl(req); });
}

ExecutionResult AdmissionDenied(const RateLimitPolicy& policy) {
  return ExecutionResult(Outcome::ADMISSION_DENIED, fmt::format(
      "Rate limit exceeded. Maximum {} requests per {:g} seconds.", policy.max_requests, policy.window));
}

ExecutionResult ServerError(const char* action, const std::string& what) {
  spdlog::warn("{} failed: {}", action, what);
  return ExecutionResult(Outcome::INTERNAL_FAULT, "Server error: " + what);
}

std::vector<std::string> ChildEnvironment() {
  std::vector<std::string> ret;
  if (kInheritEnv) {
    for (char** env = environ; *env; env++) ret.emplace_back(*env);
    return ret;
  }
  for (auto& name : kEnvAllowlist) {
    if (const char* val = getenv(name.c_str())) ret.push_back(name + '=' + val);
  }
  return ret;
}

const std::string& InterpreterVersion() {
  static std::once_flag flag;
  static std::string version;
  std::call_once(flag, []() {
    ProcessOptions opt;
    opt.command = {kInterpreter, "-c", "import sys; sys.stdout.write(sys.version)"};
    opt.envs = ChildEnvironment();
    opt.deadline = kVersionDeadline;
    ProcessResult res = RunProcess(opt);
    if (res.status == ProcessStatus::EXITED && res.exit_code == 0) {
      version = std::move(res.output);
    } else {
      spdlog::warn("Cannot determine interpreter version: {} {}",
                   ProcessStatusName(res.status), res.fault.size() ? res.fault : res.error);
      version = "unknown";
    }
  });
  return version;
}
