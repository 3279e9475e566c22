#include <signal.h>

#include <spdlog/spdlog.h>
#include <coderun/gate.h>
#include <coderun/paths.h>
#include <coderun/logger.h>
#include "config.h"
#include "server.h"

namespace {

void LogBanner() {
  spdlog::info("coderun {} listening on http://{}:{} with {} workers",
               kVersionCode, kListenHost, kListenPort, kMaxParallel);
  spdlog::info("Interpreter: {} ({})", kInterpreter, InterpreterVersion());
  spdlog::info("run: {} requests / {}s per client, deadline {}s",
               kRunPolicy.max_requests, kRunPolicy.window, kRunDeadline);
  spdlog::info("install: {} requests / {}s per client, deadline {}s",
               kInstallPolicy.max_requests, kInstallPolicy.window, kInstallDeadline);
  spdlog::info("Execution units in {}; child environment: {}; output cap: {}", UnitRoot().c_str(),
               kInheritEnv ? "inherited" : "allowlist",
               kMaxOutput ? std::to_string(kMaxOutput / 1024) + " KiB" : std::string("none"));
}

} // namespace

int main(int argc, char** argv) {
  int verbosity = 0;
  bool ok = ParseArgs(argc, argv, verbosity);
  InitLogger(verbosity);
  if (!ok) return 1;
  // writes to a closed client socket must not kill the server
  signal(SIGPIPE, SIG_IGN);
  LogBanner();
  return ServerWorkLoop() ? 0 : 1;
}
