#ifndef INCLUDE_DYNEXEC_SUBMISSION_H_
#define INCLUDE_DYNEXEC_SUBMISSION_H_

#include <string>
#include <vector>
#include <optional>

// seconds
constexpr int kMinTimeout = 10, kMaxTimeout = 300, kDefaultTimeout = 60;
// MiB
constexpr int kMinMemory = 32, kMaxMemory = 512, kDefaultMemory = 128;

#define ENUM_EXECUTION_STATUS_ \
  X(SUCCESS, "success") \
  X(COMPLETED_WITH_ERROR, "completed_with_error") \
  X(TIMEOUT, "timeout") \
  X(SECURITY_REJECTED, "security_rejected") \
  X(BACKEND_UNAVAILABLE, "backend_unavailable") \
  X(INFRASTRUCTURE_ERROR, "infrastructure_error")
enum class ExecutionStatus {
#define X(name, str) name,
  ENUM_EXECUTION_STATUS_
#undef X
};

#define ENUM_BACKEND_ \
  X(NONE, "none") \
  X(CONTAINER, "container") \
  X(LOCAL_RESTRICTED, "local_restricted")
enum class Backend {
#define X(name, str) name,
  ENUM_BACKEND_
#undef X
};

// trust level of the backend that ran the code
#define ENUM_ISOLATION_ \
  X(NONE, "none") \
  X(FULL, "full") \
  X(DEGRADED, "degraded")
enum class Isolation {
#define X(name, str) name,
  ENUM_ISOLATION_
#undef X
};

class CodeSubmission {
 public:
  std::string source;
  int timeout; // seconds
  int memory; // MiB

  CodeSubmission() : timeout(kDefaultTimeout), memory(kDefaultMemory) {}
  // out-of-range limits are clamped, never rejected
  CodeSubmission(std::string src, int timeout_seconds, int memory_limit_mb);
};

struct Violation {
  std::string rule_id;
  std::string fragment;
};

class SecurityVerdict {
 public:
  bool safe;
  // in the order they appear in the source
  std::vector<Violation> violations;

  SecurityVerdict() : safe(true) {}
};

// compile-only check with the host interpreter
class SyntaxCheck {
 public:
  bool valid;
  std::string error;
  int line, column; // 1-based; 0 if unknown

  SyntaxCheck() : valid(true), line(0), column(0) {}
};

class ExecutionResult {
 public:
  ExecutionStatus status;
  std::optional<int> exit_code;
  std::string stdout_data, stderr_data;
  double execution_time; // seconds
  Backend backend_used;
  Isolation isolation;
  int timeout, memory; // limits actually applied
  bool output_truncated;
  std::vector<Violation> violations;
  std::string error; // sanitized; engine-side failures only

  ExecutionResult() :
      status(ExecutionStatus::INFRASTRUCTURE_ERROR),
      execution_time(0),
      backend_used(Backend::NONE),
      isolation(Isolation::NONE),
      timeout(kDefaultTimeout), memory(kDefaultMemory),
      output_truncated(false) {}
};

#endif  // INCLUDE_DYNEXEC_SUBMISSION_H_
