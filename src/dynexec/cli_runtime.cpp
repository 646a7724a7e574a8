#include "cli_runtime.h"

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace {

// output of management commands is small; anything beyond this is noise
constexpr size_t kCliOutput = 64 * 1024;

inline std::string Trim(const std::string& str) {
  size_t l = str.find_first_not_of(" \t\r\n");
  if (l == std::string::npos) return "";
  size_t r = str.find_last_not_of(" \t\r\n");
  return str.substr(l, r - l + 1);
}

inline bool Succeeded(const ProcessResult& res) {
  return res.started && !res.timed_out && res.signal == 0 && res.exit_code == 0;
}

} // namespace

std::vector<std::string> CreateUnitArgs(const UnitOptions& opt) {
  std::vector<std::string> args = {"create", "--name", opt.name};
  if (!opt.network) args.insert(args.end(), {"--network", "none"});
  if (opt.read_only_rootfs) args.push_back("--read-only");
  if (!opt.scratch_mount.empty()) {
    args.insert(args.end(), {"--tmpfs",
        fmt::format("{}:rw,noexec,nosuid,size={}k", opt.scratch_mount, opt.scratch_size)});
  }
  if (opt.memory > 0) {
    // swap equal to memory means no swap at all
    args.insert(args.end(), {
        "--memory", fmt::format("{}m", opt.memory),
        "--memory-swap", fmt::format("{}m", opt.memory)});
  }
  if (opt.cpus > 0) args.insert(args.end(), {"--cpus", fmt::format("{}", opt.cpus)});
  if (opt.pids > 0) args.insert(args.end(), {"--pids-limit", std::to_string(opt.pids)});
  args.insert(args.end(), {
      "--user", fmt::format("{}:{}", opt.uid, opt.gid),
      "--cap-drop", "ALL",
      "--security-opt", "no-new-privileges",
      "--label", "dynexec=1",
      opt.image});
  args.insert(args.end(), opt.command.begin(), opt.command.end());
  return args;
}

ProcessResult CliRuntime::Call_(const std::vector<std::string>& args, long timeout_ms, size_t max_output) {
  ProcessOptions opt;
  opt.command.push_back(command_);
  opt.command.insert(opt.command.end(), args.begin(), args.end());
  // the client needs DOCKER_HOST, HOME, XDG_RUNTIME_DIR and the like
  opt.preserve_env = true;
  opt.wall_time = timeout_ms;
  opt.max_output = max_output ? max_output : kCliOutput;
  ProcessResult res = RunProcess(opt);
  if (!Succeeded(res)) {
    spdlog::debug("{} {} failed: started={} exit={} signal={} timed_out={} stderr={}",
                  command_, args.empty() ? "" : args[0], res.started, res.exit_code,
                  res.signal, res.timed_out, Trim(res.stderr_data));
  }
  return res;
}

bool CliRuntime::Check_(const std::vector<std::string>& args, long timeout_ms) {
  ProcessResult res = Call_(args, timeout_ms);
  if (Succeeded(res)) return true;
  spdlog::warn("{} {} failed: {}", command_, fmt::join(args, " "),
               res.started ? Trim(res.stderr_data) : res.error);
  return false;
}

bool CliRuntime::Ping() {
  // fails when the client exists but the daemon is not reachable
  ProcessResult res = Call_({"version", "--format", "{{.Server.Version}}"}, ping_timeout);
  if (!Succeeded(res)) return false;
  spdlog::debug("{} server version {}", command_, Trim(res.stdout_data));
  return true;
}

bool CliRuntime::ImageExists(const std::string& tag) {
  // a missing image is the expected case, so no warning
  return Succeeded(Call_({"image", "inspect", "--format", "{{.Id}}", tag}, call_timeout));
}

bool CliRuntime::BuildImage(const std::filesystem::path& context, const std::string& tag) {
  spdlog::info("Building image {} from {}", tag, context.c_str());
  return Check_({"build", "-q", "-t", tag, context.string()}, build_timeout);
}

std::optional<std::string> CliRuntime::CreateUnit(const UnitOptions& opt) {
  auto args = CreateUnitArgs(opt);
  ProcessResult res = Call_(args, call_timeout);
  if (!Succeeded(res)) {
    spdlog::warn("Failed to create unit {}: {}", opt.name,
                 res.started ? Trim(res.stderr_data) : res.error);
    return std::nullopt;
  }
  std::string id = Trim(res.stdout_data);
  if (id.empty()) {
    spdlog::warn("Failed to create unit {}: no id returned", opt.name);
    return std::nullopt;
  }
  // the client may print pull progress or warnings before the id
  if (size_t pos = id.find_last_of('\n'); pos != std::string::npos) id = Trim(id.substr(pos + 1));
  return id;
}

bool CliRuntime::StartUnit(const std::string& id) {
  return Check_({"start", id}, call_timeout);
}

WaitStatus CliRuntime::WaitUnit(const std::string& id, long timeout_ms, int* exit_code) {
  ProcessResult res = Call_({"wait", id}, timeout_ms);
  if (res.timed_out) return WaitStatus::TIMEOUT;
  if (!Succeeded(res)) {
    spdlog::warn("Failed waiting unit {}: {}", id, res.started ? Trim(res.stderr_data) : res.error);
    return WaitStatus::ERROR;
  }
  try {
    int code = std::stoi(Trim(res.stdout_data));
    if (exit_code) *exit_code = code;
  } catch (const std::logic_error&) {
    spdlog::warn("Unexpected wait output for unit {}: {}", id, Trim(res.stdout_data));
    return WaitStatus::ERROR;
  }
  return WaitStatus::EXITED;
}

std::optional<UnitLogs> CliRuntime::FetchLogs(const std::string& id, size_t max_bytes) {
  ProcessResult res = Call_({"logs", id}, call_timeout, max_bytes);
  if (!Succeeded(res)) {
    spdlog::warn("Failed fetching logs of unit {}: {}", id,
                 res.started ? Trim(res.stderr_data) : res.error);
    return std::nullopt;
  }
  UnitLogs logs;
  logs.stdout_data = std::move(res.stdout_data);
  logs.stderr_data = std::move(res.stderr_data);
  logs.truncated = res.truncated;
  return logs;
}

bool CliRuntime::KillUnit(const std::string& id) {
  return Check_({"kill", id}, call_timeout);
}

// removing something that was never created counts as success
bool CliRuntime::RemoveUnit(const std::string& id) {
  if (Succeeded(Call_({"rm", "-f", id}, call_timeout))) return true;
  if (!Succeeded(Call_({"container", "inspect", "--format", "{{.Id}}", id}, call_timeout)) &&
      Succeeded(Call_({"version"}, ping_timeout))) {
    return true;
  }
  spdlog::warn("{} rm -f {} failed", command_, id);
  return false;
}

bool CliRuntime::RemoveImage(const std::string& tag) {
  if (Succeeded(Call_({"image", "rm", "-f", tag}, call_timeout))) return true;
  // a lookup failure only means "missing" while the daemon answers
  if (!ImageExists(tag) && Succeeded(Call_({"version"}, ping_timeout))) return true;
  spdlog::warn("{} image rm -f {} failed", command_, tag);
  return false;
}
