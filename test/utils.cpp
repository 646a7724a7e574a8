#include "utils.h"

#include <thread>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <dynexec/paths.h>
#include "../src/dynexec/utils.h"

namespace fs = std::filesystem;

bool FakeRuntime::Ping() {
  ping_count++;
  if (ping_delay) std::this_thread::sleep_for(std::chrono::milliseconds(ping_delay.load()));
  return reachable;
}

bool FakeRuntime::ImageExists(const std::string& tag) {
  std::lock_guard lck(mtx_);
  return images_.count(tag);
}

bool FakeRuntime::BuildImage(const fs::path& context, const std::string& tag) {
  if (fail_at == FailAt::BUILD && tag.rfind("dynexec-job:", 0) == 0) {
    if (leak) AddImage(tag);
    return false;
  }
  build_count++;
  std::string source;
  if (std::ifstream fin(context / "main.py"); fin) {
    std::stringstream ss;
    ss << fin.rdbuf();
    source = ss.str();
  }
  std::lock_guard lck(mtx_);
  images_.insert(tag);
  image_sources_[tag] = source;
  return true;
}

std::optional<std::string> FakeRuntime::CreateUnit(const UnitOptions& opt) {
  std::lock_guard lck(mtx_);
  if (fail_at == FailAt::CREATE) {
    if (leak) units_.insert(opt.name);
    return std::nullopt;
  }
  if (!images_.count(opt.image)) return std::nullopt;
  std::string id = "unit-" + std::to_string(++unit_seq_);
  units_.insert(id);
  unit_images_[id] = opt.image;
  created_.push_back(opt);
  return id;
}

bool FakeRuntime::StartUnit(const std::string& id) {
  if (fail_at == FailAt::START) return false;
  std::lock_guard lck(mtx_);
  return units_.count(id);
}

WaitStatus FakeRuntime::WaitUnit(const std::string& id, long, int* exit_code) {
  if (fail_at == FailAt::WAIT) return WaitStatus::ERROR;
  if (hang) return WaitStatus::TIMEOUT;
  std::string source;
  {
    std::lock_guard lck(mtx_);
    if (!units_.count(id)) return WaitStatus::ERROR;
    source = image_sources_[unit_images_[id]];
  }
  std::string out;
  int code = FakeRun(source, out);
  if (exit_code) *exit_code = code;
  return WaitStatus::EXITED;
}

std::optional<UnitLogs> FakeRuntime::FetchLogs(const std::string& id, size_t max_bytes) {
  if (fail_at == FailAt::LOGS) return std::nullopt;
  std::string source;
  {
    std::lock_guard lck(mtx_);
    if (!units_.count(id)) return std::nullopt;
    source = image_sources_[unit_images_[id]];
  }
  UnitLogs logs;
  FakeRun(source, logs.stdout_data);
  if (max_bytes && logs.stdout_data.size() > max_bytes) {
    logs.stdout_data.resize(max_bytes);
    logs.truncated = true;
  }
  return logs;
}

bool FakeRuntime::KillUnit(const std::string& id) {
  kill_count++;
  std::lock_guard lck(mtx_);
  return units_.count(id);
}

bool FakeRuntime::RemoveUnit(const std::string& id) {
  if (fail_at == FailAt::REMOVE) return false;
  std::lock_guard lck(mtx_);
  units_.erase(id);
  return true;
}

bool FakeRuntime::RemoveImage(const std::string& tag) {
  std::lock_guard lck(mtx_);
  images_.erase(tag);
  image_sources_.erase(tag);
  return true;
}

void FakeRuntime::AddImage(const std::string& tag) {
  std::lock_guard lck(mtx_);
  images_.insert(tag);
}

bool FakeRuntime::HasImage(const std::string& tag) const {
  std::lock_guard lck(mtx_);
  return images_.count(tag);
}

std::set<std::string> FakeRuntime::JobImages() const {
  std::lock_guard lck(mtx_);
  std::set<std::string> ret;
  for (auto& i : images_) {
    if (i.rfind("dynexec-job:", 0) == 0) ret.insert(i);
  }
  return ret;
}

std::set<std::string> FakeRuntime::Units() const {
  std::lock_guard lck(mtx_);
  return units_;
}

std::vector<UnitOptions> FakeRuntime::Created() const {
  std::lock_guard lck(mtx_);
  return created_;
}

int FakeRun(const std::string& source, std::string& out) {
  std::istringstream ss(source);
  std::string line;
  const std::string print_prefix = "print(\"", print_suffix = "\")";
  const std::string exit_prefix = "raise SystemExit(";
  while (std::getline(ss, line)) {
    if (line.rfind(print_prefix, 0) == 0 && line.size() >= print_prefix.size() + print_suffix.size() &&
        line.compare(line.size() - print_suffix.size(), print_suffix.size(), print_suffix) == 0) {
      out += line.substr(print_prefix.size(), line.size() - print_prefix.size() - print_suffix.size());
      out += '\n';
    } else if (line.rfind(exit_prefix, 0) == 0) {
      return std::stoi(line.substr(exit_prefix.size()));
    }
  }
  return 0;
}

int SandboxDirCount() {
  int ret = 0;
  std::error_code ec;
  for (auto& i : fs::directory_iterator(kWorkRoot, ec)) {
    if (i.path().filename().string().rfind("dynexec-", 0) == 0) ret++;
  }
  return ret;
}

std::string HostPython() {
  return FindExecutable("python3").string();
}
