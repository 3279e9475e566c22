#include <stdlib.h>
#include <stdexcept>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <coderun/paths.h>

spdlog::level::level_enum log_level;

class MyEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    spdlog::set_pattern("[%P] %+");
    spdlog::set_level(log_level);
    char path[] = "/tmp/coderun_test_XXXXXX";
    if (!mkdtemp(path)) throw std::runtime_error("Failed to create unit root");
    kUnitRoot = path;
  }
  void TearDown() override {
    fs::remove_all(kUnitRoot);
  }
};

testing::Environment* const my_env = testing::AddGlobalTestEnvironment(new MyEnvironment);

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  log_level = spdlog::level::warn;
  if (argc > 1) {
    if (std::string("-v") == argv[1]) log_level = spdlog::level::info;
    if (std::string("-vv") == argv[1]) log_level = spdlog::level::debug;
  }
  return RUN_ALL_TESTS();
}
