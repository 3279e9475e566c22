#ifndef INCLUDE_CODERUN_GATE_H_
#define INCLUDE_CODERUN_GATE_H_

#include <string>
#include <vector>
#include <exception>

#include "rate_limiter.h"

// interpreter used for both code execution and package installation
extern std::string kInterpreter;
// wall-clock deadlines, seconds
extern double kRunDeadline;
extern double kInstallDeadline;
// child environment: full inheritance, or only the variables in kEnvAllowlist
extern bool kInheritEnv;
extern std::vector<std::string> kEnvAllowlist;
// bytes of stdout and of stderr kept per child; 0 = unlimited
extern size_t kMaxOutput;

#define ENUM_OUTCOME_ \
  X(OK, "OK", "Exited normally") \
  X(NONZERO_EXIT, "NZ", "Exited with nonzero status") \
  X(TIMEOUT, "TLE", "Deadline exceeded") \
  X(VALIDATION_FAILED, "VF", "Rejected by validation") \
  X(ADMISSION_DENIED, "RL", "Rejected by rate limit") \
  X(INTERNAL_FAULT, "ERR", "Server error")
enum class Outcome {
#define X(name, abr, desc) name,
  ENUM_OUTCOME_
#undef X
};

struct RunRequest {
  std::string code;
};

struct InstallRequest {
  std::string package;
};

// What the transport layer renders; output & errors are always set (possibly empty)
struct ExecutionResult {
  bool success;
  std::string output, errors;
  Outcome outcome;

  ExecutionResult() : success(false), outcome(Outcome::INTERNAL_FAULT) {}
  ExecutionResult(Outcome outcome, std::string errors) :
      success(false), errors(std::move(errors)), outcome(outcome) {}
};

// Accepts [A-Za-z0-9\-_.\[\]]+ not starting with '-'
bool ValidatePackageName(const std::string&);

// Neither of these throws; every fault is folded into the result.
ExecutionResult RunCode(const RunRequest&);
ExecutionResult InstallPackage(const InstallRequest&);

ExecutionResult AdmissionDenied(const RateLimitPolicy&);

// INTERNAL_FAULT result reporting "Server error: <what>"; logs the failed action
ExecutionResult ServerError(const char* action, const std::string& what);

// Any exception escaping func becomes an INTERNAL_FAULT result.
template <class Func>
ExecutionResult FaultBoundary(const char* action, Func&& func) {
  try {
    return func();
  } catch (const std::exception& err) {
    return ServerError(action, err.what());
  } catch (...) {
    return ServerError(action, "unknown error");
  }
}

// Run handler() only if the limiter admits the client.
template <class Func>
ExecutionResult WithAdmission(RateLimiter& limiter, const std::string& client, Func&& handler) {
  if (!limiter.Admit(client)) return AdmissionDenied(limiter.Policy());
  return handler();
}

// Environment passed to every child, as NAME=VALUE entries
std::vector<std::string> ChildEnvironment();

// sys.version of kInterpreter; computed once
const std::string& InterpreterVersion();

#endif  // INCLUDE_CODERUN_GATE_H_
