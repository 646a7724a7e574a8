#ifndef DYNEXEC_PROCESS_H_
#define DYNEXEC_PROCESS_H_

#include <string>
#include <vector>

class ProcessOptions {
 public:
  std::vector<std::string> command; // command[0] is searched in PATH
  bool preserve_env; // override envs
  std::vector<std::string> envs;
  std::string workdir;
  long wall_time; // ms; 0 for no limit
  size_t max_output; // bytes per stream; 0 for no limit
  // resource limits applied in the child; 0 for unchanged
  long vss; // KiB
  long cpu_time; // s
  int file_num;
  long fsize; // KiB
  // put the child in its own process group so the whole tree can be killed
  bool new_group;

  ProcessOptions() :
      preserve_env(false),
      wall_time(0),
      max_output(0),
      vss(0), cpu_time(0),
      file_num(0), fsize(0),
      new_group(true) {}
};

struct ProcessResult {
  bool started = false; // false if pipe/fork/exec failed; see error
  int exit_code = 0; // valid if signal == 0
  int signal = 0;
  bool timed_out = false; // killed by the wall clock watchdog
  bool truncated = false; // some output exceeded max_output and was dropped
  long wall_time = 0; // ms
  std::string stdout_data, stderr_data;
  std::string error;
};

// Run a command with stdin from /dev/null and stdout/stderr captured separately.
// Blocks until the process exits or the wall time runs out, in which case the
// process (group) is killed with SIGKILL. Never leaves a child unreaped.
ProcessResult RunProcess(const ProcessOptions&);

#endif  // DYNEXEC_PROCESS_H_
