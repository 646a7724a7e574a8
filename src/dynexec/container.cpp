#include "container.h"

#include <chrono>
#include <spdlog/spdlog.h>
#include <dynexec/paths.h>
#include "harness.h"

bool ContainerResources::Release() {
  bool ok = true;
  if (!unit_.empty()) {
    if (runtime_.RemoveUnit(unit_)) {
      unit_.clear();
    } else {
      ok = false;
    }
  }
  if (!image_.empty()) {
    if (runtime_.RemoveImage(image_)) {
      image_.clear();
    } else {
      ok = false;
    }
  }
  if (!scratch_.Remove()) ok = false;
  return ok;
}

ContainerOrchestrator::ContainerOrchestrator(std::shared_ptr<IsolationRuntime> runtime, ContainerOptions opt) :
    runtime_(std::move(runtime)),
    opt_(std::move(opt)),
    harness_version_(HarnessVersion(opt_.base_image)),
    base_ready_(false) {}

std::string ContainerOrchestrator::BaseTag() const {
  return BaseImageTag(harness_version_);
}

bool ContainerOrchestrator::EnsureBaseImage() {
  if (base_ready_) return true;
  std::lock_guard lck(base_mtx_);
  if (base_ready_) return true;
  std::string tag = BaseTag();
  if (runtime_->ImageExists(tag)) {
    spdlog::info("Reusing base image {}", tag);
    base_ready_ = true;
    return true;
  }
  ScratchDir context(BaseImageContextPath(harness_version_));
  if (!context.Create()) return false;
  if (!WriteFile(context.path() / "runner.py", RunnerScript(SandboxSource(-1, true)), kPerm644) ||
      !WriteFile(context.path() / "Dockerfile", BaseDockerfile(opt_.base_image), kPerm644)) {
    return false;
  }
  if (!runtime_->BuildImage(context.path(), tag)) {
    spdlog::error("Failed to build base image {} from {}", tag, opt_.base_image);
    return false;
  }
  base_ready_ = true;
  return true;
}

RawResult ContainerOrchestrator::Run(const ExecutionRequest& req) {
  using Clock = std::chrono::steady_clock;
  const CodeSubmission& sub = req.submission;
  RawResult ret;
  if (!req.verdict.safe) {
    ret.fault = Fault::HOST;
    ret.message = "submission was not validated";
    return ret;
  }
  Sandbox box(Backend::CONTAINER, sub.timeout, sub.memory);
  ContainerResources res(*runtime_, SandboxPath(box.id));
  ret.scratch = res.scratch();

  auto Fail = [&](Fault fault, std::string message) {
    spdlog::warn("Sandbox id={}: {}", box.id, message);
    ret.fault = fault;
    ret.message = std::move(message);
  };

  // none of the launch steps is retried within the call
  auto Launch = [&]() -> std::optional<std::string> {
    if (!EnsureBaseImage()) {
      Fail(Fault::RUNTIME, "base image " + BaseTag() + " is not available");
      return std::nullopt;
    }
    if (!res.CreateScratch() ||
        !WriteFile(SandboxSource(box.id), sub.source, kPerm644) ||
        !WriteFile(SandboxDockerfile(box.id), JobDockerfile(BaseTag()), kPerm644)) {
      Fail(Fault::HOST, "cannot prepare build context in " + res.scratch().string());
      return std::nullopt;
    }
    // a command killed on timeout may still have taken effect in the daemon,
    // so names are registered for teardown before the command is issued
    std::string tag = SandboxImageTag(box.id);
    res.SetImage(tag);
    if (!runtime_->BuildImage(res.scratch(), tag)) {
      Fail(Fault::RUNTIME, "failed to build image " + tag + " from " + res.scratch().string());
      return std::nullopt;
    }
    UnitOptions opt;
    opt.name = SandboxUnitName(box.id);
    opt.image = tag;
    opt.command = RunnerCommand("python3", SandboxHarness(box.id, true));
    opt.memory = sub.memory;
    opt.cpus = opt_.cpus;
    opt.pids = opt_.pids;
    res.SetUnit(opt.name);
    auto unit = runtime_->CreateUnit(opt);
    if (!unit) {
      Fail(Fault::RUNTIME, "failed to create unit " + opt.name);
      return std::nullopt;
    }
    res.SetUnit(*unit);
    if (!runtime_->StartUnit(*unit)) {
      Fail(Fault::RUNTIME, "failed to start unit " + opt.name);
      return std::nullopt;
    }
    return unit;
  };

  if (auto unit = Launch()) {
    box.state = SandboxState::RUNNING;
    auto start = Clock::now();
    int exit_code = 0;
    switch (runtime_->WaitUnit(*unit, sub.timeout * 1000L, &exit_code)) {
      case WaitStatus::EXITED:
        ret.exit_code = exit_code;
        break;
      case WaitStatus::TIMEOUT:
        spdlog::info("Sandbox id={} timed out after {}s", box.id, sub.timeout);
        ret.timed_out = true;
        if (!runtime_->KillUnit(*unit)) spdlog::warn("Failed to kill unit {}", *unit);
        break;
      case WaitStatus::ERROR:
        Fail(Fault::RUNTIME, "lost track of unit " + *unit);
        break;
    }
    ret.wall_time = std::chrono::duration<double>(Clock::now() - start).count();
    // output up to the kill point is still wanted
    if (auto logs = runtime_->FetchLogs(*unit, opt_.max_output)) {
      ret.stdout_data = std::move(logs->stdout_data);
      ret.stderr_data = std::move(logs->stderr_data);
      ret.truncated = logs->truncated;
    } else if (ret.fault == Fault::NONE) {
      Fail(Fault::RUNTIME, "failed to fetch output of unit " + *unit);
    }
    box.state = SandboxState::FINISHED;
  }

  if (!res.Release() && ret.fault == Fault::NONE) {
    Fail(Fault::TEARDOWN, "failed to clean up sandbox " + SandboxUnitName(box.id));
  }
  box.state = SandboxState::TORN_DOWN;
  spdlog::debug("Sandbox id={} done: state={} exit={} timed_out={} fault={}", box.id,
                SandboxStateName(box.state), ret.exit_code.value_or(-1), ret.timed_out,
                FaultName(ret.fault));
  return ret;
}
