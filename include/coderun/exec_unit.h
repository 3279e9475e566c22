#ifndef INCLUDE_CODERUN_EXEC_UNIT_H_
#define INCLUDE_CODERUN_EXEC_UNIT_H_

#include <string>

#include "paths.h"

namespace internal {

// number of units created since startup; for testing
long UnitCount();

} // internal

// RAII holder of one piece of untrusted code, materialized as a uniquely named file.
// Owned by exactly one request; removed on destruction on every path out of its scope.
class ExecutionUnit {
  fs::path path_;
 public:
  // throws std::system_error if the file cannot be created or written
  explicit ExecutionUnit(const std::string& content);
  ~ExecutionUnit() { Release(); }

  ExecutionUnit(const ExecutionUnit&) = delete;
  ExecutionUnit& operator=(const ExecutionUnit&) = delete;

  const fs::path& Path() const { return path_; }

  // Idempotent; a unit that is already gone is not an error
  bool Release();
};

#endif  // INCLUDE_CODERUN_EXEC_UNIT_H_
