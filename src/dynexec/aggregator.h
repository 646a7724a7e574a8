#ifndef DYNEXEC_AGGREGATOR_H_
#define DYNEXEC_AGGREGATOR_H_

#include <string>
#include <filesystem>

#include <dynexec/submission.h>
#include "sandbox.h"

// longest error message handed to callers
constexpr size_t kMaxMessage = 512;

// Strip host details from an engine-side message: the sandbox directory
// becomes /sandbox, other absolute paths become <path>, credential-like
// key=value pairs are masked and the length is capped.
std::string SanitizeMessage(const std::string& message, const std::filesystem::path& scratch);

Isolation BackendIsolation(Backend);

// Map a backend's raw output onto the caller-facing result. Limits are
// filled in by the caller.
ExecutionResult Normalize(const RawResult&, Backend);

#endif  // DYNEXEC_AGGREGATOR_H_
