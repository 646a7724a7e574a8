#ifndef DYNEXEC_SANDBOX_H_
#define DYNEXEC_SANDBOX_H_

#include <string>
#include <optional>
#include <filesystem>

#include <dynexec/submission.h>

#define ENUM_SANDBOX_STATE_ \
  X(CREATED) \
  X(RUNNING) \
  X(FINISHED) \
  X(TORN_DOWN)
enum class SandboxState {
#define X(name) name,
  ENUM_SANDBOX_STATE_
#undef X
};

// what went wrong on the engine side of a call
#define ENUM_FAULT_ \
  X(NONE) \
  X(HOST) /* scratch directory, pipes, fork... */ \
  X(RUNTIME) /* the isolation runtime failed or vanished; invalidates availability */ \
  X(TEARDOWN) /* execution finished but cleanup failed */
enum class Fault {
#define X(name) name,
  ENUM_FAULT_
#undef X
};

// One ephemeral execution context. Owned by the call that created it.
class Sandbox {
 public:
  const long id;
  const Backend backend;
  const int timeout; // s
  const int memory; // MiB
  SandboxState state;

  Sandbox(Backend backend, int timeout, int memory);
  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
};

// Only constructed for submissions that passed validation.
struct ExecutionRequest {
  const CodeSubmission& submission;
  const SecurityVerdict& verdict;
  Backend backend;
};

// unnormalized output of either backend
struct RawResult {
  std::optional<int> exit_code; // empty if killed by timeout or never started
  std::string stdout_data, stderr_data;
  double wall_time = 0; // s
  bool timed_out = false;
  bool truncated = false;
  Fault fault = Fault::NONE;
  std::string message; // internal; sanitized before it leaves the engine
  std::filesystem::path scratch; // host path of the sandbox directory
};

const char* SandboxStateName(SandboxState);
const char* FaultName(Fault);

#endif  // DYNEXEC_SANDBOX_H_
