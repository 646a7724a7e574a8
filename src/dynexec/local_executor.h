#ifndef DYNEXEC_LOCAL_EXECUTOR_H_
#define DYNEXEC_LOCAL_EXECUTOR_H_

#include <optional>

#include "sandbox.h"
#include "utils.h"

struct LocalOptions {
  fs::path python; // resolved interpreter; empty if none
  size_t max_output = 1024 * 1024; // bytes per stream
  int file_num = 64;
  long fsize = 16 * 1024; // KiB
};

// Fallback backend: runs the source with the host interpreter in a child
// process under resource limits and the restricted runner. There is no
// namespace separation, so results are flagged as degraded isolation.
class LocalExecutor {
  const LocalOptions opt_;
 public:
  explicit LocalExecutor(LocalOptions opt) : opt_(std::move(opt)) {}

  bool Available() const;
  RawResult Run(const ExecutionRequest&);
  // Compile the source without running it. nullopt if the interpreter is
  // unusable or its answer cannot be read.
  std::optional<SyntaxCheck> CheckSyntax(const std::string& source);
};

#endif  // DYNEXEC_LOCAL_EXECUTOR_H_
