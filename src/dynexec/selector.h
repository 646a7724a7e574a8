#ifndef DYNEXEC_SELECTOR_H_
#define DYNEXEC_SELECTOR_H_

#include <mutex>
#include <chrono>
#include <memory>
#include <condition_variable>

#include <dynexec/runtime.h>
#include <dynexec/submission.h>

struct SelectorOptions {
  Backend forced = Backend::NONE; // NONE = choose automatically
  bool allow_local = true;
  bool local_available = false; // a host interpreter was found
  long probe_interval = 30000; // ms; 0 probes on every call
};

// Chooses the backend for each call from the cached reachability of the
// isolation runtime. At most one probe runs at a time; callers arriving
// during a probe use the previous result, or wait if there is none yet.
class BackendSelector {
  using Clock = std::chrono::steady_clock;

  const std::shared_ptr<IsolationRuntime> runtime_;
  const SelectorOptions opt_;

  std::mutex mtx_;
  std::condition_variable cv_;
  bool available_;
  bool checked_;
  bool probing_;
  Clock::time_point last_probe_;

  bool Probe_();
 public:
  BackendSelector(std::shared_ptr<IsolationRuntime> runtime, SelectorOptions opt);
  BackendSelector(const BackendSelector&) = delete;
  BackendSelector& operator=(const BackendSelector&) = delete;

  Backend Select();
  // force a new probe on the next call; used after an unexpected runtime failure
  void Invalidate();
  bool RuntimeAvailable();
};

#endif  // DYNEXEC_SELECTOR_H_
