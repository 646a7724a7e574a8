#ifndef DYNEXEC_HARNESS_H_
#define DYNEXEC_HARNESS_H_

#include <string>
#include <vector>

// bump when the generated runner changes in a way cached images must not survive
extern const char kHarnessRevision[];

// Python runner that executes the source file at source_path as __main__ with
// restricted builtins and an import hook enforcing the module allow-list.
// Imported modules are seen through views without private attributes, and an
// audit hook refuses process, network and file access while the source runs.
// User output goes to stdout/stderr unchanged; an uncaught exception prints a
// traceback without runner frames and exits with status 1.
std::string RunnerScript(const std::string& source_path);

// Python script that compiles the source file without running it and prints
// {"valid", "error", "line", "column"} as JSON
std::string SyntaxCheckScript(const std::string& source_path);

// command line to start the runner with the given interpreter
std::vector<std::string> RunnerCommand(const std::string& python, const std::string& runner_path);

// build context of the shared base image
std::string BaseDockerfile(const std::string& base_image);
// build context of a single-use image adding one source file on top of the base image
std::string JobDockerfile(const std::string& base_tag);

// changes whenever the runner, the allow-lists or the base image change
std::string HarnessVersion(const std::string& base_image);

#endif  // DYNEXEC_HARNESS_H_
