#ifndef INCLUDE_DYNEXEC_VALIDATOR_H_
#define INCLUDE_DYNEXEC_VALIDATOR_H_

#include <string>
#include <vector>

#include "submission.h"

// bytes
constexpr size_t kMaxSourceSize = 64 * 1024;

#define ENUM_RULE_ \
  X(EMPTY_SOURCE, "empty-source") \
  X(SOURCE_TOO_LARGE, "source-too-large") \
  X(DENIED_IMPORT, "denied-import") \
  X(IMPORT_NOT_ALLOWED, "import-not-allowed") \
  X(BLOCKED_CALL, "blocked-call") \
  X(BLOCKED_ATTRIBUTE, "blocked-attribute")
enum class Rule {
#define X(name, id) name,
  ENUM_RULE_
#undef X
};

const char* RuleId(Rule);

// Static pre-execution check of Python source. This is a lexical scan
// (comments and string literals are skipped, f-string bodies are scanned),
// so obfuscated access can get past it; the execution backend remains
// the security boundary. Nothing is executed.
SecurityVerdict Validate(const std::string& source);

// modules user code may import; shared with the runner harness
const std::vector<std::string>& AllowedModules();
// builtins exposed to user code by the runner harness (exception classes are added separately)
const std::vector<std::string>& AllowedBuiltins();

#endif  // INCLUDE_DYNEXEC_VALIDATOR_H_
