#include "local_executor.h"

#include <signal.h>
#include <unistd.h>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <dynexec/paths.h>
#include "harness.h"
#include "process.h"

bool LocalExecutor::Available() const {
  return !opt_.python.empty() && access(opt_.python.c_str(), X_OK) == 0;
}

RawResult LocalExecutor::Run(const ExecutionRequest& req) {
  const CodeSubmission& sub = req.submission;
  RawResult ret;
  if (!req.verdict.safe) {
    ret.fault = Fault::HOST;
    ret.message = "submission was not validated";
    return ret;
  }
  Sandbox box(Backend::LOCAL_RESTRICTED, sub.timeout, sub.memory);
  ScratchDir scratch(SandboxPath(box.id));
  ret.scratch = scratch.path();

  if (!scratch.Create() ||
      !WriteFile(SandboxSource(box.id), sub.source, kPerm644) ||
      !WriteFile(SandboxHarness(box.id), RunnerScript(SandboxSource(box.id)), kPerm644)) {
    ret.fault = Fault::HOST;
    ret.message = "cannot prepare sandbox directory " + scratch.path().string();
  } else {
    ProcessOptions opt;
    opt.command = RunnerCommand(opt_.python, SandboxHarness(box.id));
    opt.preserve_env = false; // empty environment
    opt.workdir = scratch.path();
    opt.wall_time = sub.timeout * 1000L;
    opt.max_output = opt_.max_output;
    opt.vss = sub.memory * 1024L;
    opt.cpu_time = sub.timeout + 1;
    opt.file_num = opt_.file_num;
    opt.fsize = opt_.fsize;

    box.state = SandboxState::RUNNING;
    ProcessResult res = RunProcess(opt);
    box.state = SandboxState::FINISHED;
    if (!res.started) {
      ret.fault = Fault::HOST;
      ret.message = res.error;
    } else {
      ret.wall_time = res.wall_time / 1000.0;
      ret.stdout_data = std::move(res.stdout_data);
      ret.stderr_data = std::move(res.stderr_data);
      ret.truncated = res.truncated;
      if (res.timed_out || res.signal == SIGXCPU) {
        // cpu limit is above the wall limit, so SIGXCPU means the same thing
        ret.timed_out = true;
      } else if (res.signal) {
        ret.exit_code = 128 + res.signal;
      } else {
        ret.exit_code = res.exit_code;
      }
    }
  }

  if (!scratch.Remove() && ret.fault == Fault::NONE) {
    ret.fault = Fault::TEARDOWN;
    ret.message = "failed to remove " + scratch.path().string();
  }
  box.state = SandboxState::TORN_DOWN;
  if (ret.fault != Fault::NONE) spdlog::warn("Sandbox id={}: {}", box.id, ret.message);
  spdlog::debug("Sandbox id={} done: exit={} timed_out={} fault={}", box.id,
                ret.exit_code.value_or(-1), ret.timed_out, FaultName(ret.fault));
  return ret;
}

std::optional<SyntaxCheck> LocalExecutor::CheckSyntax(const std::string& source) {
  constexpr int kCheckTimeout = 10; // s
  constexpr int kCheckMemory = 256; // MiB
  if (!Available()) return std::nullopt;
  Sandbox box(Backend::LOCAL_RESTRICTED, kCheckTimeout, kCheckMemory);
  ScratchDir scratch(SandboxPath(box.id));
  if (!scratch.Create() ||
      !WriteFile(SandboxSource(box.id), source, kPerm644) ||
      !WriteFile(SandboxSyntaxChecker(box.id), SyntaxCheckScript(SandboxSource(box.id)), kPerm644)) {
    spdlog::warn("Sandbox id={}: cannot prepare syntax check", box.id);
    return std::nullopt;
  }
  ProcessOptions opt;
  opt.command = RunnerCommand(opt_.python, SandboxSyntaxChecker(box.id));
  opt.workdir = scratch.path();
  opt.wall_time = box.timeout * 1000L;
  opt.max_output = opt_.max_output;
  opt.vss = box.memory * 1024L;
  opt.cpu_time = box.timeout;
  opt.file_num = opt_.file_num;
  opt.fsize = opt_.fsize;
  ProcessResult res = RunProcess(opt);
  if (!scratch.Remove()) spdlog::warn("Sandbox id={}: failed to remove {}", box.id, scratch.path().c_str());
  if (!res.started || res.timed_out || res.signal || res.exit_code) {
    spdlog::warn("Sandbox id={}: syntax check failed: exit={} signal={} timed_out={} {}", box.id,
                 res.exit_code, res.signal, res.timed_out, res.started ? res.stderr_data : res.error);
    return std::nullopt;
  }
  try {
    auto json = nlohmann::json::parse(res.stdout_data);
    SyntaxCheck ret;
    ret.valid = json.at("valid").get<bool>();
    if (!ret.valid) {
      ret.error = json.at("error").get<std::string>();
      if (json["line"].is_number_integer()) ret.line = json["line"].get<int>();
      if (json["column"].is_number_integer()) ret.column = json["column"].get<int>();
    }
    return ret;
  } catch (const nlohmann::json::exception& e) {
    spdlog::warn("Sandbox id={}: unreadable syntax check output: {}", box.id, e.what());
    return std::nullopt;
  }
}
