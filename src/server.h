#ifndef SERVER_H_
#define SERVER_H_

#include <string>
#include <httplib.h>
#include <coderun/rate_limiter.h>

extern std::string kListenHost;
extern int kListenPort;
extern int kMaxParallel; // worker threads serving requests
extern std::string kStaticRoot; // mounted at / if not empty
extern std::string kAllowedOrigin;
extern const char kVersionCode[];

// Register all routes and hooks. The limiters must outlive the server.
void SetupServer(httplib::Server&, RateLimiter& run_limiter, RateLimiter& install_limiter);

// Serve on kListenHost:kListenPort until the process ends.
// Returns false only if the socket cannot be bound.
bool ServerWorkLoop();

#endif  // SERVER_H_
