#include "sandbox.h"

#include <spdlog/spdlog.h>
#include <dynexec/utils.h>

Sandbox::Sandbox(Backend backend, int timeout, int memory) :
    id(GetUniqueSandboxId()),
    backend(backend),
    timeout(timeout),
    memory(memory),
    state(SandboxState::CREATED) {
  spdlog::debug("Sandbox id={} created: backend={} timeout={}s memory={}MiB",
                id, BackendName(backend), timeout, memory);
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;

#define X(...) X_RETURN_ARG1(SandboxState, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SandboxStateName, SandboxState, ENUM_SANDBOX_STATE_)
#undef X

#define X(...) X_RETURN_ARG1(Fault, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* FaultName, Fault, ENUM_FAULT_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
