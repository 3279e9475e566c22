#include <fstream>
#include <gtest/gtest.h>
#include <coderun/gate.h>
#include "config.h"
#include "server.h"
#include "utils.h"

class ConfigTest : public ::testing::Test {
 protected:
  // every global the config layer may write
  ScopedValue<std::string> host_{kListenHost, kListenHost};
  ScopedValue<int> port_{kListenPort, kListenPort};
  ScopedValue<int> parallel_{kMaxParallel, kMaxParallel};
  ScopedValue<std::string> interpreter_{kInterpreter, kInterpreter};
  ScopedValue<fs::path> unit_root_{kUnitRoot, kUnitRoot};
  ScopedValue<std::string> static_root_{kStaticRoot, kStaticRoot};
  ScopedValue<std::string> origin_{kAllowedOrigin, kAllowedOrigin};
  ScopedValue<RateLimitPolicy> run_policy_{kRunPolicy, kRunPolicy};
  ScopedValue<RateLimitPolicy> install_policy_{kInstallPolicy, kInstallPolicy};
  ScopedValue<double> run_deadline_{kRunDeadline, kRunDeadline};
  ScopedValue<double> install_deadline_{kInstallDeadline, kInstallDeadline};
  ScopedValue<bool> inherit_env_{kInheritEnv, kInheritEnv};
  ScopedValue<std::vector<std::string>> allowlist_{kEnvAllowlist, kEnvAllowlist};
  ScopedValue<size_t> max_output_{kMaxOutput, kMaxOutput};
  TempDir dir_;

  fs::path WriteConfig(const std::string& body) {
    fs::path path = dir_.Path() / "coderun.conf";
    std::ofstream(path) << body;
    return path;
  }

  bool Parse(std::vector<std::string> args, int& verbosity) {
    args.insert(args.begin(), "coderun-server");
    std::vector<char*> argv;
    for (auto& i : args) argv.push_back(i.data());
    argv.push_back(nullptr);
    return ParseArgs(args.size(), argv.data(), verbosity);
  }
};

TEST_F(ConfigTest, DefaultsAreValid) {
  EXPECT_TRUE(CheckConfig());
  EXPECT_EQ(kListenHost, "0.0.0.0");
  EXPECT_EQ(kListenPort, 5000);
  EXPECT_EQ(kInterpreter, "python3");
  EXPECT_EQ(kRunDeadline, 30);
  EXPECT_EQ(kInstallDeadline, 120);
  EXPECT_FALSE(kInheritEnv);
  EXPECT_EQ(kMaxOutput, 0u);
}

TEST_F(ConfigTest, ReadsGlobalSection) {
  fs::path conf = WriteConfig(
      "host = 127.0.0.1\n"
      "port = 8080\n"
      "parallel = 3\n"
      "interpreter = /usr/bin/python3\n"
      "unit_root = /var/tmp\n"
      "allowed_origin = https://example.com\n"
      "run_max_requests = 5\n"
      "run_window = 10\n"
      "run_deadline = 2.5\n"
      "install_max_requests = 1\n"
      "install_window = 600\n"
      "install_deadline = 60\n"
      "max_output_kb = 64\n");
  ASSERT_TRUE(ParseConfig(conf));
  EXPECT_EQ(kListenHost, "127.0.0.1");
  EXPECT_EQ(kListenPort, 8080);
  EXPECT_EQ(kMaxParallel, 3);
  EXPECT_EQ(kInterpreter, "/usr/bin/python3");
  EXPECT_EQ(kUnitRoot, fs::path("/var/tmp"));
  EXPECT_EQ(kAllowedOrigin, "https://example.com");
  EXPECT_EQ(kRunPolicy.max_requests, 5);
  EXPECT_EQ(kRunPolicy.window, 10);
  EXPECT_EQ(kRunDeadline, 2.5);
  EXPECT_EQ(kInstallPolicy.max_requests, 1);
  EXPECT_EQ(kInstallPolicy.window, 600);
  EXPECT_EQ(kInstallDeadline, 60);
  EXPECT_EQ(kMaxOutput, 64u * 1024);
  EXPECT_TRUE(CheckConfig());
}

TEST_F(ConfigTest, AbsentKeysKeepDefaults) {
  ASSERT_TRUE(ParseConfig(WriteConfig("port = 6000\n")));
  EXPECT_EQ(kListenPort, 6000);
  EXPECT_EQ(kListenHost, "0.0.0.0");
  EXPECT_EQ(kRunPolicy.max_requests, 20);
  EXPECT_EQ(kInstallPolicy.window, 300);
}

TEST_F(ConfigTest, AllowlistAndInheritance) {
  fs::path conf = WriteConfig(
      "run_window = 0\n"
      "env_allowlist = PATH, HOME ,\n"
      "inherit_env = true\n");
  ASSERT_TRUE(ParseConfig(conf));
  EXPECT_EQ(kEnvAllowlist, (std::vector<std::string>{"PATH", "HOME"}));
  EXPECT_TRUE(kInheritEnv);
  EXPECT_FALSE(CheckConfig());
}

TEST_F(ConfigTest, RejectsNonPositiveValues) {
  for (auto body : {"run_max_requests = 0\n", "install_window = -1\n", "run_deadline = 0\n",
                    "install_deadline = -5\n", "port = 0\n", "port = 70000\n", "parallel = 0\n"}) {
    ScopedValue<RateLimitPolicy> run(kRunPolicy, kRunPolicy);
    ScopedValue<RateLimitPolicy> install(kInstallPolicy, kInstallPolicy);
    ScopedValue<double> run_deadline(kRunDeadline, kRunDeadline);
    ScopedValue<double> install_deadline(kInstallDeadline, kInstallDeadline);
    ScopedValue<int> port(kListenPort, kListenPort);
    ScopedValue<int> parallel(kMaxParallel, kMaxParallel);
    ASSERT_TRUE(ParseConfig(WriteConfig(body))) << body;
    EXPECT_FALSE(CheckConfig()) << body;
  }
}

TEST_F(ConfigTest, MissingFile) {
  EXPECT_FALSE(ParseConfig(dir_.Path() / "nonexistent.conf"));
  int verbosity = 0;
  EXPECT_FALSE(Parse({"-c", (dir_.Path() / "nonexistent.conf").string()}, verbosity));
}

TEST_F(ConfigTest, CommandLineOverridesFile) {
  fs::path conf = WriteConfig(
      "host = 127.0.0.1\n"
      "port = 6000\n"
      "parallel = 3\n"
      "interpreter = /usr/bin/python3\n");
  int verbosity = 0;
  ASSERT_TRUE(Parse({"-c", conf.string(), "-p", "7000", "--interpreter", "python3.11", "-v", "-v"},
                    verbosity));
  EXPECT_EQ(kListenPort, 7000);
  EXPECT_EQ(kInterpreter, "python3.11");
  EXPECT_EQ(kListenHost, "127.0.0.1");
  EXPECT_EQ(kMaxParallel, 3);
  EXPECT_EQ(verbosity, 2);
}

TEST_F(ConfigTest, InvalidCommandLineValue) {
  fs::path conf = WriteConfig("");
  int verbosity = 0;
  EXPECT_FALSE(Parse({"-c", conf.string(), "-P", "0"}, verbosity));
  EXPECT_FALSE(Parse({"-c", conf.string(), "--no-such-flag"}, verbosity));
}
