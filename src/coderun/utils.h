#ifndef CODERUN_UTILS_H_
#define CODERUN_UTILS_H_

#include <coderun/utils.h>

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

// Mark every descriptor >= minfd close-on-exec.
// Called between fork and exec, so it only uses async-signal-safe calls.
int CloexecFrom(int minfd);

#endif  // CODERUN_UTILS_H_
