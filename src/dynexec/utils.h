#ifndef DYNEXEC_UTILS_H_
#define DYNEXEC_UTILS_H_

#include <string>
#include <filesystem>

#include <dynexec/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm644 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::others_read;
constexpr fs::perms kPerm755 =
    fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);

// search PATH if name has no slash; empty if not found or not executable
fs::path FindExecutable(const std::string& name);

// 64-bit FNV-1a, hex encoded
std::string HashHex(const std::string&);

// Scratch directory owned by one call. Removed on destruction unless
// Remove() has already succeeded.
class ScratchDir {
  fs::path path_;
  bool created_;
 public:
  explicit ScratchDir(fs::path path) : path_(std::move(path)), created_(false) {}
  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;
  ~ScratchDir() { Remove(); }

  bool Create(fs::perms = fs::perms::owner_all);
  bool Remove();
  const fs::path& path() const { return path_; }
};

#endif  // DYNEXEC_UTILS_H_
