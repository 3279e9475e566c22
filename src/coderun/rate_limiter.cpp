#include <coderun/rate_limiter.h>

#include <algorithm>

#include <spdlog/spdlog.h>
#include <coderun/utils.h>

RateLimitPolicy kRunPolicy = {20, 60};
RateLimitPolicy kInstallPolicy = {10, 300};

RateLimiter::RateLimiter(const RateLimitPolicy& policy) :
    policy_(policy), last_compact_(-1e18) {}

void RateLimiter::Compact_(double now) {
  size_t before = windows_.size();
  for (auto it = windows_.begin(); it != windows_.end();) {
    // timestamps are appended in order, so the newest one decides
    if (it->second.empty() || now - it->second.back() >= policy_.window) {
      it = windows_.erase(it);
    } else {
      ++it;
    }
  }
  last_compact_ = now;
  if (before != windows_.size()) {
    spdlog::debug("Rate limiter compacted: {} -> {} clients", before, windows_.size());
  }
}

bool RateLimiter::Admit(const std::string& client) {
  return Admit(client, MonotonicTimestamp());
}

bool RateLimiter::Admit(const std::string& client, double now) {
  std::lock_guard lck(mtx_);
  if (now - last_compact_ >= policy_.window) Compact_(now);
  auto& window = windows_[client];
  while (window.size() && now - window.front() >= policy_.window) window.pop_front();
  if (window.size() >= (size_t)policy_.max_requests) {
    spdlog::debug("Rate limit hit: client={} count={}", client, window.size());
    return false;
  }
  // keep the sequence sorted even if callers pass a stale timestamp
  window.insert(std::upper_bound(window.begin(), window.end(), now), now);
  return true;
}

size_t RateLimiter::TrackedClients() {
  std::lock_guard lck(mtx_);
  return windows_.size();
}
