#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <map>
#include <set>
#include <mutex>
#include <atomic>
#include <vector>

#include <gtest/gtest.h>
#include <dynexec/runtime.h>
#include <dynexec/submission.h>

// In-memory isolation runtime. "Runs" a source by interpreting its
// print("...") and raise SystemExit(n) lines.
class FakeRuntime : public IsolationRuntime {
  mutable std::mutex mtx_;
  std::set<std::string> images_, units_;
  std::vector<UnitOptions> created_;
  std::map<std::string, std::string> image_sources_;
  std::map<std::string, std::string> unit_images_;
  long unit_seq_ = 0;
 public:
  enum class FailAt { NONE, BUILD, CREATE, START, WAIT, LOGS, REMOVE };

  // behavior
  std::atomic<bool> reachable{true};
  std::atomic<FailAt> fail_at{FailAt::NONE};
  std::atomic<bool> hang{false}; // WaitUnit times out
  // a failing build or create still leaves its image or unit behind
  std::atomic<bool> leak{false};
  std::atomic<int> ping_delay{0}; // ms

  // observations
  std::atomic<int> ping_count{0};
  std::atomic<int> build_count{0};
  std::atomic<int> kill_count{0};

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

  void AddImage(const std::string& tag);
  bool HasImage(const std::string& tag) const;
  // images other than the shared base image
  std::set<std::string> JobImages() const;
  std::set<std::string> Units() const;
  std::vector<UnitOptions> Created() const;
};

// output and exit code of the tiny print/SystemExit interpreter
int FakeRun(const std::string& source, std::string& out);

// number of sandbox directories currently under kWorkRoot
int SandboxDirCount();

// an interpreter usable by the local executor, or empty
std::string HostPython();

#endif // TEST_UTILS_H_
