#ifndef INCLUDE_DYNEXEC_RUNTIME_H_
#define INCLUDE_DYNEXEC_RUNTIME_H_

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

struct UnitOptions {
  std::string name;
  std::string image;
  std::vector<std::string> command;
  long memory; // MiB; swap is limited to the same amount
  double cpus;
  int pids;
  int uid, gid;
  bool network; // false = no network interface at all
  bool read_only_rootfs;
  std::string scratch_mount; // writable tmpfs inside a read-only rootfs
  long scratch_size; // KiB

  UnitOptions() :
      memory(0), cpus(0), pids(0),
      uid(65534), gid(65534),
      network(false), read_only_rootfs(true),
      scratch_mount("/tmp"), scratch_size(16 * 1024) {}
};

enum class WaitStatus { EXITED, TIMEOUT, ERROR };

struct UnitLogs {
  std::string stdout_data, stderr_data;
  bool truncated = false;
};

// The capability set the engine needs from a container runtime.
// Implementations must not block longer than the given timeouts, and
// all methods must be callable from multiple threads at once.
class IsolationRuntime {
 public:
  virtual ~IsolationRuntime() = default;

  virtual bool Ping() = 0;
  virtual bool ImageExists(const std::string& tag) = 0;
  virtual bool BuildImage(const std::filesystem::path& context, const std::string& tag) = 0;
  // return the unit id, or nullopt on failure
  virtual std::optional<std::string> CreateUnit(const UnitOptions&) = 0;
  virtual bool StartUnit(const std::string& id) = 0;
  // TIMEOUT if the unit is still running after timeout_ms; exit_code is set only on EXITED
  virtual WaitStatus WaitUnit(const std::string& id, long timeout_ms, int* exit_code) = 0;
  virtual std::optional<UnitLogs> FetchLogs(const std::string& id, size_t max_bytes) = 0;
  virtual bool KillUnit(const std::string& id) = 0;
  virtual bool RemoveUnit(const std::string& id) = 0;
  virtual bool RemoveImage(const std::string& tag) = 0;
};

#endif  // INCLUDE_DYNEXEC_RUNTIME_H_
