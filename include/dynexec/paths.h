#ifndef INCLUDE_DYNEXEC_PATHS_H_
#define INCLUDE_DYNEXEC_PATHS_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// all scratch directories live under this root
extern fs::path kWorkRoot;

// one directory per sandbox; removed at the end of the call
// if inside_box = true, id is not used and the path seen by the running code is returned
fs::path SandboxPath(long id);
fs::path SandboxSource(long id, bool inside_box = false);
fs::path SandboxHarness(long id, bool inside_box = false);
fs::path SandboxDockerfile(long id);
fs::path SandboxSyntaxChecker(long id);
std::string SandboxUnitName(long id);
std::string SandboxImageTag(long id);

// shared by all calls with the same harness version
fs::path BaseImageContextPath(const std::string& harness_version);
std::string BaseImageTag(const std::string& harness_version);

#endif  // INCLUDE_DYNEXEC_PATHS_H_
