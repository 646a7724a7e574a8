#include "utils.h"

#include <unistd.h>
#include <cstring>
#include <cstdlib>
#include <atomic>
#include <fstream>
#include <algorithm>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace {

std::atomic_long sandbox_id_seq = 0;

} // namespace

long GetUniqueSandboxId() {
  return ++sandbox_id_seq;
}

int ClampTimeout(int seconds) {
  return std::clamp(seconds, kMinTimeout, kMaxTimeout);
}

int ClampMemory(int mib) {
  return std::clamp(mib, kMinMemory, kMaxMemory);
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(ExecutionStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExecutionStatusName, ExecutionStatus, ENUM_EXECUTION_STATUS_)
#undef X

#define X(...) X_RETURN_ARG2(Isolation, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* IsolationName, Isolation, ENUM_ISOLATION_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2

static const char* kBackendNameTable[] = {
#define X(name, str) str,
  ENUM_BACKEND_
#undef X
};

const char* BackendName(Backend backend) {
  return kBackendNameTable[(int)backend];
}

Backend GetBackend(const std::string& str) {
  for (size_t i = 0; i < sizeof(kBackendNameTable) / sizeof(kBackendNameTable[0]); i++) {
    if (str == kBackendNameTable[i]) return (Backend)i;
  }
  // short aliases for the command line
  if (str == "local") return Backend::LOCAL_RESTRICTED;
  return Backend::NONE;
}

CodeSubmission::CodeSubmission(std::string src, int timeout_seconds, int memory_limit_mb) :
    source(std::move(src)),
    timeout(ClampTimeout(timeout_seconds)),
    memory(ClampMemory(memory_limit_mb)) {}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, size {}", path.c_str(), content.size());
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size())) {
      spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permission of {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

fs::path FindExecutable(const std::string& name) {
  if (name.empty()) return {};
  if (name.find('/') != std::string::npos) {
    if (access(name.c_str(), X_OK) == 0) return name;
    return {};
  }
  const char* env_path = getenv("PATH");
  std::string search = env_path ? env_path : "/usr/local/bin:/usr/bin:/bin";
  size_t pos = 0;
  while (pos <= search.size()) {
    size_t nxt = search.find(':', pos);
    if (nxt == std::string::npos) nxt = search.size();
    fs::path dir = search.substr(pos, nxt - pos);
    if (!dir.empty()) {
      fs::path candidate = dir / name;
      if (access(candidate.c_str(), X_OK) == 0) return candidate;
    }
    pos = nxt + 1;
  }
  return {};
}

std::string HashHex(const std::string& str) {
  uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : str) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return fmt::format("{:016x}", hash);
}

bool ScratchDir::Create(fs::perms perms) {
  bool ret = CreateDirs(path_, perms);
  // a half-created directory still has to be cleaned up
  std::error_code ec;
  created_ = fs::exists(path_, ec);
  return ret;
}

bool ScratchDir::Remove() {
  if (!created_) return true;
  if (!RemoveAll(path_)) return false;
  created_ = false;
  return true;
}
