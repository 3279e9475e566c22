#include "utils.h"

#include <stdlib.h>
#include <chrono>
#include <thread>
#include <fstream>
#include <sstream>
#include <stdexcept>

bool ProcessAlive(pid_t pid) {
  std::ifstream fin("/proc/" + std::to_string(pid) + "/stat");
  if (!fin) return false;
  std::string line;
  std::getline(fin, line);
  // pid (comm) state ...; comm may contain spaces
  size_t pos = line.rfind(')');
  if (pos == std::string::npos || pos + 2 >= line.size()) return false;
  char state = line[pos + 2];
  return state != 'Z' && state != 'X';
}

bool WaitProcessGone(pid_t pid, double timeout) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::duration<double>(timeout);
  while (ProcessAlive(pid)) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return true;
}

size_t UnitFileCount() {
  size_t ret = 0;
  for (auto& entry : fs::directory_iterator(UnitRoot())) {
    (void)entry;
    ret++;
  }
  return ret;
}

TempDir::TempDir() {
  char path[] = "/tmp/coderun_scratch_XXXXXX";
  if (!mkdtemp(path)) throw std::runtime_error("Failed to create");
  path_ = path;
}

TempDir::~TempDir() {
  fs::remove_all(path_);
}

std::string ReadFile(const fs::path& path) {
  std::ifstream fin(path);
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

void WriteScript(const fs::path& path, const std::string& body) {
  {
    std::ofstream fout(path);
    fout << "#!/bin/sh\n" << body;
  }
  fs::permissions(path, fs::perms::owner_all);
}
