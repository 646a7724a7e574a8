#ifndef DYNEXEC_CONTAINER_H_
#define DYNEXEC_CONTAINER_H_

#include <mutex>
#include <atomic>
#include <memory>

#include <dynexec/runtime.h>
#include "sandbox.h"
#include "utils.h"

struct ContainerOptions {
  std::string base_image = "python:3.12-slim";
  double cpus = 0.5;
  int pids = 64;
  size_t max_output = 1024 * 1024; // bytes per stream
};

// Everything one call allocates in the runtime and on the host. Released in
// reverse order of creation; the destructor retries whatever is left.
class ContainerResources {
  IsolationRuntime& runtime_;
  ScratchDir scratch_;
  std::string image_;
  std::string unit_;
 public:
  ContainerResources(IsolationRuntime& runtime, fs::path scratch) :
      runtime_(runtime), scratch_(std::move(scratch)) {}
  ContainerResources(const ContainerResources&) = delete;
  ContainerResources& operator=(const ContainerResources&) = delete;
  ~ContainerResources() { Release(); }

  bool CreateScratch() { return scratch_.Create(); }
  const fs::path& scratch() const { return scratch_.path(); }
  void SetImage(std::string tag) { image_ = std::move(tag); }
  void SetUnit(std::string id) { unit_ = std::move(id); }

  // false if anything could not be removed
  bool Release();
};

class ContainerOrchestrator {
  const std::shared_ptr<IsolationRuntime> runtime_;
  const ContainerOptions opt_;
  const std::string harness_version_;

  std::mutex base_mtx_;
  std::atomic<bool> base_ready_;
 public:
  ContainerOrchestrator(std::shared_ptr<IsolationRuntime> runtime, ContainerOptions opt);
  ContainerOrchestrator(const ContainerOrchestrator&) = delete;
  ContainerOrchestrator& operator=(const ContainerOrchestrator&) = delete;

  // Build the shared base image once; an image left by an earlier process
  // with the same harness version is reused.
  bool EnsureBaseImage();
  // the runtime may have lost the image; check again on the next call
  void ForgetBaseImage() { base_ready_ = false; }
  std::string BaseTag() const;

  // Run one validated submission in a fresh unit. Never throws for runtime
  // failures; they are reported through RawResult::fault.
  RawResult Run(const ExecutionRequest&);
};

#endif  // DYNEXEC_CONTAINER_H_
