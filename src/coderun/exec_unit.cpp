#include <coderun/exec_unit.h>

#include <errno.h>
#include <unistd.h>
#include <atomic>
#include <cstring>
#include <system_error>

#include <spdlog/spdlog.h>

namespace {

std::atomic_long unit_count_seq = 0;

bool WriteAll(int fd, const char* buf, size_t len) {
  while (len) {
    ssize_t ret = write(fd, buf, len);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    buf += ret;
    len -= ret;
  }
  return true;
}

} // namespace

namespace internal {

long UnitCount() {
  return unit_count_seq;
}

} // internal

ExecutionUnit::ExecutionUnit(const std::string& content) {
  std::string name = UnitTemplate();
  int fd = mkstemps(name.data(), sizeof(kUnitSuffix) - 1);
  if (fd < 0) {
    int err = errno;
    spdlog::warn("Failed creating execution unit {}: {}", name, strerror(err));
    throw std::system_error(err, std::generic_category(), "cannot create execution unit");
  }
  path_ = name;
  ++unit_count_seq;
  if (!WriteAll(fd, content.data(), content.size())) {
    int err = errno;
    close(fd);
    Release();
    spdlog::warn("Failed writing execution unit {}: {}", name, strerror(err));
    throw std::system_error(err, std::generic_category(), "cannot write execution unit");
  }
  if (close(fd) < 0) {
    int err = errno;
    Release();
    throw std::system_error(err, std::generic_category(), "cannot write execution unit");
  }
  spdlog::debug("Execution unit created: {} ({} bytes)", path_.c_str(), content.size());
}

bool ExecutionUnit::Release() {
  if (path_.empty()) return true;
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec && ec.value() != ENOENT) {
    spdlog::warn("Failed deleting {}: {}", path_.c_str(), ec.message());
    return false;
  }
  spdlog::debug("Execution unit removed: {}", path_.c_str());
  path_.clear();
  return true;
}
