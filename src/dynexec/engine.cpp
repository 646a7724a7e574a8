#include <dynexec/engine.h>

#include <spdlog/spdlog.h>
#include <dynexec/utils.h>
#include <dynexec/validator.h>
#include "aggregator.h"
#include "cli_runtime.h"
#include "container.h"
#include "local_executor.h"
#include "selector.h"

std::string kRuntimeCommand = "docker";
std::string kBaseImage = "python:3.12-slim";
std::string kPythonPath = "python3";
long kProbeInterval = 30;
double kCpuLimit = 0.5;
int kPidsLimit = 64;
long kMaxOutput = 1024;
bool kAllowLocalFallback = true;
Backend kForcedBackend = Backend::NONE;

Engine::Engine() : Engine(std::make_shared<CliRuntime>(kRuntimeCommand)) {}

Engine::Engine(std::shared_ptr<IsolationRuntime> runtime) : runtime_(std::move(runtime)) {
  LocalOptions local_opt;
  local_opt.python = FindExecutable(kPythonPath);
  local_opt.max_output = kMaxOutput * 1024;
  local_ = std::make_unique<LocalExecutor>(local_opt);

  ContainerOptions container_opt;
  container_opt.base_image = kBaseImage;
  container_opt.cpus = kCpuLimit;
  container_opt.pids = kPidsLimit;
  container_opt.max_output = kMaxOutput * 1024;
  container_ = std::make_unique<ContainerOrchestrator>(runtime_, container_opt);

  SelectorOptions selector_opt;
  selector_opt.forced = kForcedBackend;
  selector_opt.allow_local = kAllowLocalFallback;
  selector_opt.local_available = local_->Available();
  selector_opt.probe_interval = kProbeInterval * 1000;
  selector_ = std::make_unique<BackendSelector>(runtime_, selector_opt);

  if (!selector_opt.local_available) {
    spdlog::info("No usable interpreter at {}; local fallback disabled", kPythonPath);
  }
}

Engine::~Engine() = default;

ExecutionResult Engine::Execute_(const CodeSubmission& sub) {
  ExecutionResult ret;
  SecurityVerdict verdict = Validate(sub.source);
  if (!verdict.safe) {
    ret.status = ExecutionStatus::SECURITY_REJECTED;
    ret.violations = std::move(verdict.violations);
    ret.error = "code failed security validation";
    return ret;
  }
  Backend backend = selector_->Select();
  if (backend == Backend::NONE) {
    spdlog::warn("No execution backend available");
    ret.status = ExecutionStatus::BACKEND_UNAVAILABLE;
    ret.error = "no execution backend available";
    return ret;
  }
  ExecutionRequest req{sub, verdict, backend};
  RawResult raw = backend == Backend::CONTAINER ? container_->Run(req) : local_->Run(req);
  if (raw.fault == Fault::RUNTIME) {
    selector_->Invalidate();
    container_->ForgetBaseImage();
  }
  return Normalize(raw, backend);
}

ExecutionResult Engine::Execute(const CodeSubmission& sub) {
  ExecutionResult ret;
  try {
    ret = Execute_(sub);
  } catch (const std::exception& e) {
    spdlog::error("Execution failed: {}", e.what());
    ret = ExecutionResult();
    ret.status = ExecutionStatus::INFRASTRUCTURE_ERROR;
    ret.error = SanitizeMessage(e.what(), {});
  }
  ret.timeout = sub.timeout;
  ret.memory = sub.memory;
  spdlog::info("Execution finished: status={} backend={} time={:.3f}s",
               ExecutionStatusName(ret.status), BackendName(ret.backend_used), ret.execution_time);
  return ret;
}

ExecutionResult Engine::ExecuteDynamicCode(const std::string& source, int timeout_seconds, int memory_limit_mb) {
  return Execute(CodeSubmission(source, timeout_seconds, memory_limit_mb));
}

SecurityVerdict CheckCodeSecurity(const std::string& source) {
  return Validate(source);
}

std::optional<SyntaxCheck> CheckSyntax(const std::string& source) {
  LocalOptions opt;
  opt.python = FindExecutable(kPythonPath);
  return LocalExecutor(opt).CheckSyntax(source);
}
