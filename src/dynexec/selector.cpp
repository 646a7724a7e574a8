#include "selector.h"

#include <spdlog/spdlog.h>
#include <dynexec/utils.h>

BackendSelector::BackendSelector(std::shared_ptr<IsolationRuntime> runtime, SelectorOptions opt) :
    runtime_(std::move(runtime)),
    opt_(opt),
    available_(false),
    checked_(false),
    probing_(false) {}

bool BackendSelector::Probe_() {
  if (!runtime_) return false;
  try {
    return runtime_->Ping();
  } catch (const std::exception& e) {
    spdlog::warn("Runtime probe failed: {}", e.what());
    return false;
  }
}

bool BackendSelector::RuntimeAvailable() {
  std::unique_lock lck(mtx_);
  while (true) {
    if (checked_ && Clock::now() - last_probe_ < std::chrono::milliseconds(opt_.probe_interval)) {
      return available_;
    }
    if (!probing_) break;
    // stale is good enough while somebody else is refreshing
    if (checked_) return available_;
    cv_.wait(lck);
  }
  probing_ = true;
  lck.unlock();
  bool res = Probe_();
  lck.lock();
  if (!checked_ || res != available_) {
    if (res) {
      spdlog::info("Isolation runtime is reachable");
    } else {
      spdlog::warn("Isolation runtime is not reachable");
    }
  }
  available_ = res;
  checked_ = true;
  probing_ = false;
  last_probe_ = Clock::now();
  cv_.notify_all();
  return res;
}

void BackendSelector::Invalidate() {
  std::lock_guard lck(mtx_);
  spdlog::info("Runtime availability invalidated");
  checked_ = false;
}

Backend BackendSelector::Select() {
  if (opt_.forced == Backend::LOCAL_RESTRICTED) {
    return opt_.local_available ? Backend::LOCAL_RESTRICTED : Backend::NONE;
  }
  Backend ret = Backend::NONE;
  if (RuntimeAvailable()) {
    ret = Backend::CONTAINER;
  } else if (opt_.forced != Backend::CONTAINER && opt_.allow_local && opt_.local_available) {
    ret = Backend::LOCAL_RESTRICTED;
  }
  spdlog::debug("Selected backend {}", BackendName(ret));
  return ret;
}
