#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <sys/types.h>
#include <gtest/gtest.h>
#include <coderun/paths.h>

// Set a global for the lifetime of the object, then restore it
template <class T>
class ScopedValue {
  T& ref_;
  T orig_;
 public:
  ScopedValue(T& ref, T value) : ref_(ref), orig_(ref) { ref_ = std::move(value); }
  ~ScopedValue() { ref_ = std::move(orig_); }
};

// false if the process is gone or only a zombie is left
bool ProcessAlive(pid_t pid);
// waits up to timeout seconds for the process to disappear
bool WaitProcessGone(pid_t pid, double timeout = 3);

// number of entries currently in the execution unit directory
size_t UnitFileCount();

// A scratch directory removed on destruction
class TempDir {
  fs::path path_;
 public:
  TempDir();
  ~TempDir();
  const fs::path& Path() const { return path_; }
};

std::string ReadFile(const fs::path&);
// write an executable shell script; used as a stand-in interpreter
void WriteScript(const fs::path&, const std::string& body);

#endif // TEST_UTILS_H_
