#ifndef INCLUDE_CODERUN_UTILS_H_
#define INCLUDE_CODERUN_UTILS_H_

#include <string>
#include <vector>

#include "gate.h"

// seconds
double MonotonicTimestamp();
double UnixTimestamp();

std::vector<std::string> SplitString(const std::string&, char delim);

const char* OutcomeToAbr(Outcome);
const char* OutcomeToDesc(Outcome);

#endif  // INCLUDE_CODERUN_UTILS_H_
