#include <fstream>
#include <iostream>
#include <iterator>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <dynexec/engine.h>
#include <dynexec/envelope.h>
#include <dynexec/logger.h>
#include <dynexec/paths.h>
#include <dynexec/utils.h>

namespace {

constexpr int kUsageError = 2;

bool check_only = false;
int timeout = kDefaultTimeout;
int memory = kDefaultMemory;
std::string input_file = "-";

bool ParseBackend(const std::string& str, Backend& backend) {
  if (str == "auto") {
    backend = Backend::NONE;
    return true;
  }
  backend = GetBackend(str);
  return backend != Backend::NONE;
}

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string work_root = ini[""]["work_root"] | "";
  if (work_root.size()) kWorkRoot = work_root;
  kRuntimeCommand = ini[""]["runtime_command"] | kRuntimeCommand;
  kBaseImage = ini[""]["base_image"] | kBaseImage;
  kPythonPath = ini[""]["python_path"] | kPythonPath;
  kProbeInterval = ini[""]["probe_interval_sec"] | kProbeInterval;
  kCpuLimit = ini[""]["cpu_limit"] | kCpuLimit;
  kMaxOutput = ini[""]["max_output_kb"] | kMaxOutput;
  kPidsLimit = ini[""]["pids_limit"] | kPidsLimit;
  kAllowLocalFallback = ini[""]["allow_local_fallback"] | kAllowLocalFallback;
  std::string backend = ini[""]["backend"] | "auto";
  if (!ParseBackend(backend, kForcedBackend)) {
    spdlog::error("Unknown backend {} in {}", backend, conf_path.c_str());
    return false;
  }
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "dynexec");
  parser.add_argument("-c", "--config")
    .default_value(std::string("/etc/dynexec.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-t", "--timeout")
    .scan<'d', int>()
    .help("Wall time limit in seconds (clamped to [10, 300])");
  parser.add_argument("-m", "--memory")
    .scan<'d', int>()
    .help("Memory limit in MiB (clamped to [32, 512])");
  parser.add_argument("--backend")
    .help("auto, container or local");
  parser.add_argument("--no-fallback")
    .default_value(false)
    .implicit_value(true)
    .help("Never run without a container runtime");
  parser.add_argument("--check-only")
    .default_value(false)
    .implicit_value(true)
    .help("Only run the static security check and a compile-only syntax check");
  parser.add_argument("file")
    .default_value(std::string("-"))
    .help("Python source file, or - for standard input");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::exception& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(kUsageError);
  }

  InitLogger(verbosity);
  fs::path config_file = parser.get<std::string>("--config");
  // the default file is optional; an explicitly given one is not
  if ((parser.is_used("--config") || fs::exists(config_file)) && !ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", config_file.c_str());
    exit(kUsageError);
  }
  if (auto val = parser.present<int>("--timeout")) timeout = val.value();
  if (auto val = parser.present<int>("--memory")) memory = val.value();
  if (auto val = parser.present<std::string>("--backend")) {
    if (!ParseBackend(val.value(), kForcedBackend)) {
      spdlog::error("Unknown backend {}", val.value());
      exit(kUsageError);
    }
  }
  if (parser["--no-fallback"] == true) kAllowLocalFallback = false;
  check_only = parser["--check-only"] == true;
  input_file = parser.get<std::string>("file");
}

bool ReadSource(std::string& source) {
  if (input_file == "-") {
    source.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return !std::cin.bad();
  }
  std::ifstream fin(input_file, std::ios::binary);
  if (!fin) return false;
  source.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  return !fin.bad();
}

void Print(const nlohmann::json& json) {
  // captured output may be cut in the middle of a UTF-8 sequence
  std::cout << json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

} // namespace

int main(int argc, char** argv) {
  ParseArgs(argc, argv);
  std::string source;
  if (!ReadSource(source)) {
    spdlog::error("Cannot read source from {}", input_file);
    return kUsageError;
  }
  if (check_only) {
    SecurityVerdict verdict = CheckCodeSecurity(source);
    auto syntax = CheckSyntax(source);
    nlohmann::json json = ToJson(verdict);
    json["syntax"] = ToJson(syntax);
    Print(json);
    return verdict.safe && (!syntax || syntax->valid) ? 0 : 1;
  }
  Engine engine;
  ExecutionResult res = engine.ExecuteDynamicCode(source, timeout, memory);
  Print(ToJson(res));
  return res.status == ExecutionStatus::SUCCESS ? 0 : 1;
}
