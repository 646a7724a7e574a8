#include <dynexec/paths.h>

#include <unistd.h>

fs::path kWorkRoot = "/tmp/dynexec";

namespace {

const char kInsideBoxRoot[] = "/sandbox";

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

// pid keeps names apart when several engines share a runtime or a work root
inline std::string SandboxName(long id) {
  return "dynexec-" + std::to_string(getpid()) + "-" + PadInt(id, 6);
}

} // namespace

fs::path SandboxPath(long id) {
  return kWorkRoot / SandboxName(id);
}

fs::path SandboxSource(long id, bool inside_box) {
  if (inside_box) return fs::path(kInsideBoxRoot) / "main.py";
  return SandboxPath(id) / "main.py";
}

fs::path SandboxHarness(long id, bool inside_box) {
  // the container harness is baked into the base image instead
  if (inside_box) return "/opt/dynexec/runner.py";
  return SandboxPath(id) / "runner.py";
}

fs::path SandboxDockerfile(long id) {
  return SandboxPath(id) / "Dockerfile";
}

fs::path SandboxSyntaxChecker(long id) {
  return SandboxPath(id) / "check.py";
}

std::string SandboxUnitName(long id) {
  return SandboxName(id);
}

std::string SandboxImageTag(long id) {
  return "dynexec-job:" + std::to_string(getpid()) + "-" + PadInt(id, 6);
}

fs::path BaseImageContextPath(const std::string& harness_version) {
  return kWorkRoot / ("base-image-" + std::to_string(getpid()) + "-" + harness_version);
}

std::string BaseImageTag(const std::string& harness_version) {
  return "dynexec-runner:" + harness_version;
}
