#ifndef INCLUDE_DYNEXEC_ENGINE_H_
#define INCLUDE_DYNEXEC_ENGINE_H_

#include <memory>
#include <optional>
#include <string>

#include "runtime.h"
#include "submission.h"

// read when an Engine is constructed
extern std::string kRuntimeCommand;
extern std::string kBaseImage;
extern std::string kPythonPath;
extern long kProbeInterval; // seconds
extern double kCpuLimit;
extern int kPidsLimit;
// KiB per stream
extern long kMaxOutput;
extern bool kAllowLocalFallback;
// NONE = choose automatically
extern Backend kForcedBackend;

class BackendSelector;
class ContainerOrchestrator;
class LocalExecutor;

class Engine {
  std::shared_ptr<IsolationRuntime> runtime_;
  std::unique_ptr<BackendSelector> selector_;
  std::unique_ptr<ContainerOrchestrator> container_;
  std::unique_ptr<LocalExecutor> local_;

  ExecutionResult Execute_(const CodeSubmission&);
 public:
  // drive the container runtime through kRuntimeCommand
  Engine();
  explicit Engine(std::shared_ptr<IsolationRuntime> runtime);
  ~Engine();
  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  // Validate, pick a backend and run. Thread-safe; every call gets its own
  // sandbox. Never throws: failures are reported in the result status.
  ExecutionResult Execute(const CodeSubmission&);
  // limits are clamped to [kMinTimeout, kMaxTimeout] and [kMinMemory, kMaxMemory]
  ExecutionResult ExecuteDynamicCode(const std::string& source,
                                     int timeout_seconds = kDefaultTimeout,
                                     int memory_limit_mb = kDefaultMemory);
};

// validation only; nothing is executed
SecurityVerdict CheckCodeSecurity(const std::string& source);
// compile the source with the interpreter at kPythonPath without running it;
// nullopt if no interpreter is usable
std::optional<SyntaxCheck> CheckSyntax(const std::string& source);

#endif  // INCLUDE_DYNEXEC_ENGINE_H_
