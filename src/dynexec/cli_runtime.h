#ifndef DYNEXEC_CLI_RUNTIME_H_
#define DYNEXEC_CLI_RUNTIME_H_

#include <dynexec/runtime.h>

#include "process.h"

// Drives a docker-compatible command line client (docker, podman).
class CliRuntime : public IsolationRuntime {
  const std::string command_;
  ProcessResult Call_(const std::vector<std::string>& args, long timeout_ms, size_t max_output = 0);
  bool Check_(const std::vector<std::string>& args, long timeout_ms);
 public:
  // ms
  long ping_timeout = 5000;
  long call_timeout = 30000;
  long build_timeout = 600000;

  explicit CliRuntime(std::string command) : command_(std::move(command)) {}

  bool Ping() override;
  bool ImageExists(const std::string& tag) override;
  bool BuildImage(const std::filesystem::path& context, const std::string& tag) override;
  std::optional<std::string> CreateUnit(const UnitOptions&) override;
  bool StartUnit(const std::string& id) override;
  WaitStatus WaitUnit(const std::string& id, long timeout_ms, int* exit_code) override;
  std::optional<UnitLogs> FetchLogs(const std::string& id, size_t max_bytes) override;
  bool KillUnit(const std::string& id) override;
  bool RemoveUnit(const std::string& id) override;
  bool RemoveImage(const std::string& tag) override;
};

// arguments of the create command, without the runtime command itself
std::vector<std::string> CreateUnitArgs(const UnitOptions&);

#endif  // DYNEXEC_CLI_RUNTIME_H_
