#ifndef INCLUDE_CODERUN_PATHS_H_
#define INCLUDE_CODERUN_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

// directory holding execution units; empty means the system temp directory
extern fs::path kUnitRoot;

fs::path UnitRoot();
// mkstemps template inside UnitRoot()
fs::path UnitTemplate();
extern const char kUnitSuffix[4];

#endif  // INCLUDE_CODERUN_PATHS_H_
