#ifndef INCLUDE_DYNEXEC_ENVELOPE_H_
#define INCLUDE_DYNEXEC_ENVELOPE_H_

#include <nlohmann/json.hpp>

#include "submission.h"

// Response envelope. Captured output is not guaranteed to be valid UTF-8,
// so serialize with error_handler_t::replace.
nlohmann::json ToJson(const ExecutionResult&);
nlohmann::json ToJson(const SecurityVerdict&);
// null when no interpreter could check the source
nlohmann::json ToJson(const std::optional<SyntaxCheck>&);

#endif  // INCLUDE_DYNEXEC_ENVELOPE_H_
