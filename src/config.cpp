#include "config.h"

#include <fstream>
#include <iostream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <coderun/gate.h>
#include <coderun/utils.h>
#include "server.h"

const char kDefaultConfig[] = "/etc/coderun.conf";

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  kListenHost = ini[""]["host"] | kListenHost;
  kListenPort = ini[""]["port"] | kListenPort;
  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  kInterpreter = ini[""]["interpreter"] | kInterpreter;
  std::string unit_root = ini[""]["unit_root"] | "";
  if (unit_root.size()) kUnitRoot = unit_root;
  kStaticRoot = ini[""]["static_root"] | kStaticRoot;
  kAllowedOrigin = ini[""]["allowed_origin"] | kAllowedOrigin;
  kRunPolicy.max_requests = ini[""]["run_max_requests"] | kRunPolicy.max_requests;
  kRunPolicy.window = ini[""]["run_window"] | kRunPolicy.window;
  kRunDeadline = ini[""]["run_deadline"] | kRunDeadline;
  kInstallPolicy.max_requests = ini[""]["install_max_requests"] | kInstallPolicy.max_requests;
  kInstallPolicy.window = ini[""]["install_window"] | kInstallPolicy.window;
  kInstallDeadline = ini[""]["install_deadline"] | kInstallDeadline;
  kInheritEnv = ini[""]["inherit_env"] | kInheritEnv;
  std::string allowlist = ini[""]["env_allowlist"] | "";
  if (allowlist.size()) kEnvAllowlist = SplitString(allowlist, ',');
  long max_output_kb = ini[""]["max_output_kb"] | (long)(kMaxOutput / 1024);
  kMaxOutput = max_output_kb < 0 ? 0 : max_output_kb * 1024;
  return true;
}

bool CheckConfig() {
  bool ok = true;
  auto Require = [&ok](bool cond, const char* msg) {
    if (cond) return;
    spdlog::error("Invalid configuration: {}", msg);
    ok = false;
  };
  Require(kListenPort > 0 && kListenPort < 65536, "port must be in 1..65535");
  Require(kMaxParallel > 0, "parallel must be positive");
  Require(kInterpreter.size(), "interpreter must not be empty");
  Require(kRunPolicy.max_requests > 0 && kRunPolicy.window > 0, "run policy must be positive");
  Require(kInstallPolicy.max_requests > 0 && kInstallPolicy.window > 0, "install policy must be positive");
  Require(kRunDeadline > 0 && kInstallDeadline > 0, "deadlines must be positive");
  return ok;
}

bool ParseArgs(int argc, char** argv, int& verbosity) {
  argparse::ArgumentParser parser(argc ? argv[0] : "coderun-server");
  parser.add_argument("-c", "--config")
    .default_value(std::string(""))
    .help("Path of configuration file (default: /etc/coderun.conf if it exists)");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-H", "--host")
    .help("Address to listen on");
  parser.add_argument("-p", "--port")
    .scan<'d', int>()
    .help("Port to listen on");
  parser.add_argument("-P", "--parallel")
    .scan<'d', int>()
    .help("Number of worker threads serving requests");
  parser.add_argument("--interpreter")
    .help("Python interpreter used to run code and pip");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return false;
  }

  fs::path config_file = parser.get<std::string>("--config");
  if (config_file.empty() && fs::exists(kDefaultConfig)) config_file = kDefaultConfig;
  if (config_file.size() && !ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", config_file.string());
    return false;
  }
  if (auto val = parser.present("--host")) kListenHost = val.value();
  if (auto val = parser.present<int>("--port")) kListenPort = val.value();
  if (auto val = parser.present<int>("--parallel")) kMaxParallel = val.value();
  if (auto val = parser.present("--interpreter")) kInterpreter = val.value();
  return CheckConfig();
}
