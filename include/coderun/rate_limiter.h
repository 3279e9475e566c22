#ifndef INCLUDE_CODERUN_RATE_LIMITER_H_
#define INCLUDE_CODERUN_RATE_LIMITER_H_

#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

struct RateLimitPolicy {
  int max_requests;
  double window; // seconds
};

// Default policies
extern RateLimitPolicy kRunPolicy;
extern RateLimitPolicy kInstallPolicy;

// Sliding-window request counter keyed by client address.
// Every limiter owns its own table; two limiters never share state.
class RateLimiter {
  const RateLimitPolicy policy_;
  std::mutex mtx_;
  std::unordered_map<std::string, std::deque<double>> windows_;
  double last_compact_;

  void Compact_(double now);
 public:
  explicit RateLimiter(const RateLimitPolicy& policy);

  const RateLimitPolicy& Policy() const { return policy_; }

  // Record a request if the client still has budget in the window ending at now.
  // Rejected requests are not recorded.
  bool Admit(const std::string& client);
  bool Admit(const std::string& client, double now);

  size_t TrackedClients();
};

#endif  // INCLUDE_CODERUN_RATE_LIMITER_H_
