#include <coderun/paths.h>

fs::path kUnitRoot;

const char kUnitSuffix[] = ".py";

fs::path UnitRoot() {
  if (!kUnitRoot.empty()) return kUnitRoot;
  std::error_code ec;
  fs::path tmp = fs::temp_directory_path(ec);
  return ec ? fs::path("/tmp") : tmp;
}

fs::path UnitTemplate() {
  return UnitRoot() / (std::string("coderun_XXXXXX") + kUnitSuffix);
}
