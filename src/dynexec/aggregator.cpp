#include "aggregator.h"

#include <cmath>
#include <regex>

#include <dynexec/paths.h>
#include <dynexec/utils.h>
#include <dynexec/envelope.h>

namespace {

void ReplaceAll(std::string& str, const std::string& from, const std::string& to) {
  if (from.empty()) return;
  for (size_t pos = str.find(from); pos != std::string::npos; pos = str.find(from, pos + to.size())) {
    str.replace(pos, from.size(), to);
  }
}

const std::regex kCredentialRegex(
    R"((password|passwd|secret|token|api[_-]?key|authorization)(\s*[:=]\s*)\S+)",
    std::regex::ECMAScript | std::regex::icase);
// absolute paths with at least two components, except the in-box root
const std::regex kPathRegex(
    R"((^|[^A-Za-z0-9._/-])/(?!sandbox\b)[A-Za-z0-9._-]+(/[A-Za-z0-9._-]+)+/?)");

} // namespace

std::string SanitizeMessage(const std::string& message, const fs::path& scratch) {
  std::string ret = message;
  if (!scratch.empty()) ReplaceAll(ret, scratch.string(), "/sandbox");
  ReplaceAll(ret, kWorkRoot.string(), "<scratch>");
  ret = std::regex_replace(ret, kCredentialRegex, "$1$2***");
  ret = std::regex_replace(ret, kPathRegex, "$1<path>");
  if (ret.size() > kMaxMessage) ret = ret.substr(0, kMaxMessage - 3) + "...";
  return ret;
}

Isolation BackendIsolation(Backend backend) {
  switch (backend) {
    case Backend::CONTAINER: return Isolation::FULL;
    case Backend::LOCAL_RESTRICTED: return Isolation::DEGRADED;
    case Backend::NONE: return Isolation::NONE;
  }
  __builtin_unreachable();
}

ExecutionResult Normalize(const RawResult& raw, Backend backend) {
  ExecutionResult ret;
  ret.backend_used = backend;
  ret.isolation = BackendIsolation(backend);
  ret.execution_time = raw.wall_time;
  ret.output_truncated = raw.truncated;
  ret.stdout_data = raw.stdout_data;
  ret.stderr_data = raw.stderr_data;
  // tracebacks of the local runner mention the host directory
  if (backend == Backend::LOCAL_RESTRICTED && !raw.scratch.empty()) {
    ReplaceAll(ret.stderr_data, raw.scratch.string(), "/sandbox");
  }
  if (raw.fault != Fault::NONE) {
    ret.status = ExecutionStatus::INFRASTRUCTURE_ERROR;
    ret.exit_code = raw.exit_code;
    ret.error = SanitizeMessage(raw.message, raw.scratch);
  } else if (raw.timed_out) {
    ret.status = ExecutionStatus::TIMEOUT;
  } else if (!raw.exit_code) {
    ret.status = ExecutionStatus::INFRASTRUCTURE_ERROR;
    ret.error = "no exit status reported";
  } else {
    ret.exit_code = raw.exit_code;
    ret.status = *raw.exit_code == 0 ?
        ExecutionStatus::SUCCESS : ExecutionStatus::COMPLETED_WITH_ERROR;
  }
  return ret;
}

nlohmann::json ToJson(const SecurityVerdict& verdict) {
  nlohmann::json violations = nlohmann::json::array();
  for (auto& i : verdict.violations) {
    violations.push_back({{"rule_id", i.rule_id}, {"fragment", i.fragment}});
  }
  return {{"safe", verdict.safe}, {"violations", std::move(violations)}};
}

nlohmann::json ToJson(const std::optional<SyntaxCheck>& check) {
  if (!check) return nullptr;
  nlohmann::json ret = {
    {"valid", check->valid},
    {"error", nullptr},
    {"line", nullptr},
    {"column", nullptr},
  };
  if (!check->valid) ret["error"] = check->error;
  if (check->line > 0) ret["line"] = check->line;
  if (check->column > 0) ret["column"] = check->column;
  return ret;
}

nlohmann::json ToJson(const ExecutionResult& res) {
  nlohmann::json ret = {
    {"status", ExecutionStatusName(res.status)},
    {"exit_code", nullptr},
    {"stdout", res.stdout_data},
    {"stderr", res.stderr_data},
    {"execution_time_seconds", std::round(res.execution_time * 1000) / 1000},
    {"backend_used", BackendName(res.backend_used)},
    {"isolation", IsolationName(res.isolation)},
    {"timeout_seconds", res.timeout},
    {"memory_limit_mb", res.memory},
    {"output_truncated", res.output_truncated},
    {"violations", nlohmann::json::array()},
    {"error", nullptr},
  };
  if (res.exit_code) ret["exit_code"] = *res.exit_code;
  for (auto& i : res.violations) {
    ret["violations"].push_back({{"rule_id", i.rule_id}, {"fragment", i.fragment}});
  }
  if (!res.error.empty()) ret["error"] = res.error;
  return ret;
}
