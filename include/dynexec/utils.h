#ifndef INCLUDE_DYNEXEC_UTILS_H_
#define INCLUDE_DYNEXEC_UTILS_H_

#include <string>

#include "submission.h"

long GetUniqueSandboxId();

int ClampTimeout(int seconds);
int ClampMemory(int mib);

const char* ExecutionStatusName(ExecutionStatus);
const char* BackendName(Backend);
const char* IsolationName(Isolation);
// returns Backend::NONE for unknown names
Backend GetBackend(const std::string&);

#endif  // INCLUDE_DYNEXEC_UTILS_H_
