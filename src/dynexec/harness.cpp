#include "harness.h"

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <dynexec/paths.h>
#include <dynexec/validator.h>
#include "utils.h"

const char kHarnessRevision[] = "4";

namespace {

// placeholders are substituted with JSON literals, which are valid Python literals too
const char kRunnerTemplate[] = R"PY(import builtins
import os
import sys
import traceback
import types

ALLOWED_MODULES = frozenset(@ALLOWED_MODULES@)
ALLOWED_BUILTINS = @ALLOWED_BUILTINS@
SOURCE_PATH = @SOURCE_PATH@

# audit events refused once the source starts running
BLOCKED_EVENTS = (
    "os.", "subprocess.", "socket.", "ctypes.", "shutil.", "pty.", "fcntl.",
    "resource.", "signal.", "mmap.", "syslog.", "sqlite3.", "webbrowser.",
    "urllib.", "http.", "ftplib.", "smtplib.", "poplib.", "imaplib.",
    "telnetlib.", "builtins.input", "sys.settrace", "sys.setprofile",
)
PUBLIC_DUNDERS = ("__all__", "__version__")
# imported lazily from C by allowed modules (time.strptime)
HELPER_MODULES = frozenset(["_strptime"])


def module_view(module, memo):
    # public attributes only; modules outside the allow-list are dropped
    view = memo.get(id(module))
    if view is not None:
        return view
    view = types.ModuleType(module.__name__, module.__doc__)
    memo[id(module)] = view
    for key, value in list(vars(module).items()):
        if key.startswith("_") and key not in PUBLIC_DUNDERS:
            continue
        if isinstance(value, types.ModuleType):
            if value.__name__.partition(".")[0] not in ALLOWED_MODULES:
                continue
            value = module_view(value, memo)
        setattr(view, key, value)
    return view


def restricted_import(name, globals=None, locals=None, fromlist=(), level=0):
    if level != 0 or (name.partition(".")[0] not in ALLOWED_MODULES and name not in HELPER_MODULES):
        raise ImportError("import of %r is not allowed" % name)
    return module_view(builtins.__import__(name, globals, locals, fromlist, level), {})


def make_builtins():
    table = {}
    for name in ALLOWED_BUILTINS:
        if hasattr(builtins, name):
            table[name] = getattr(builtins, name)
    for name, value in vars(builtins).items():
        if isinstance(value, type) and issubclass(value, BaseException):
            table[name] = value
    table["__import__"] = restricted_import
    return table


def install_audit_hook():
    # reading the standard library stays possible for lazy imports
    stdlib = os.path.realpath(os.path.dirname(os.__file__)) + os.sep
    write_flags = os.O_WRONLY | os.O_RDWR | os.O_CREAT | os.O_TRUNC | os.O_APPEND

    def in_stdlib(path):
        if not isinstance(path, (str, bytes)):
            return False
        return os.path.realpath(os.fsdecode(path)).startswith(stdlib)

    def read_only(mode, flags):
        if isinstance(mode, str):
            return set(mode) <= set("rbt")
        return isinstance(flags, int) and not flags & write_flags

    def hook(event, args):
        if event == "open":
            if in_stdlib(args[0]) and read_only(args[1], args[2]):
                return
            raise PermissionError("opening files is not allowed")
        if event in ("os.listdir", "os.scandir") and args and in_stdlib(args[0]):
            return
        if event.startswith(BLOCKED_EVENTS):
            raise PermissionError("%s is not allowed" % event)

    sys.addaudithook(hook)


def exit_status(code):
    if code is None:
        return 0
    if isinstance(code, int):
        return code
    print(code, file=sys.stderr)
    return 1


def main():
    with open(SOURCE_PATH, encoding="utf-8") as f:
        source = f.read()
    namespace = {"__name__": "__main__", "__builtins__": make_builtins()}
    try:
        code = compile(source, "main.py", "exec")
        install_audit_hook()
        exec(code, namespace)
    except SystemExit as e:
        return exit_status(e.code)
    except BaseException:
        etype, value, tb = sys.exc_info()
        traceback.print_exception(etype, value, tb.tb_next)
        return 1
    return 0


if __name__ == "__main__":
    status = main()
    sys.stdout.flush()
    sys.stderr.flush()
    sys.exit(status)
)PY";

const char kSyntaxCheckTemplate[] = R"PY(import json

SOURCE_PATH = @SOURCE_PATH@


def check(source):
    try:
        compile(source, "main.py", "exec", dont_inherit=True)
    except SyntaxError as e:
        return {"valid": False, "error": "%s: %s" % (type(e).__name__, e.msg),
                "line": e.lineno, "column": e.offset}
    except (ValueError, RecursionError, MemoryError) as e:
        return {"valid": False, "error": "%s: %s" % (type(e).__name__, e),
                "line": None, "column": None}
    return {"valid": True}


with open(SOURCE_PATH, "rb") as f:
    print(json.dumps(check(f.read())))
)PY";

void Substitute(std::string& str, const std::string& key, const std::string& value) {
  for (size_t pos = str.find(key); pos != std::string::npos; pos = str.find(key, pos + value.size())) {
    str.replace(pos, key.size(), value);
  }
}

} // namespace

std::string RunnerScript(const std::string& source_path) {
  std::string ret = kRunnerTemplate;
  Substitute(ret, "@ALLOWED_MODULES@", nlohmann::json(AllowedModules()).dump());
  Substitute(ret, "@ALLOWED_BUILTINS@", nlohmann::json(AllowedBuiltins()).dump());
  Substitute(ret, "@SOURCE_PATH@", nlohmann::json(source_path).dump());
  return ret;
}

std::string SyntaxCheckScript(const std::string& source_path) {
  std::string ret = kSyntaxCheckTemplate;
  Substitute(ret, "@SOURCE_PATH@", nlohmann::json(source_path).dump());
  return ret;
}

std::vector<std::string> RunnerCommand(const std::string& python, const std::string& runner_path) {
  // isolated mode: no site, no user site, no PYTHON* variables, no bytecode written
  return {python, "-I", "-S", "-B", "-u", runner_path};
}

std::string BaseDockerfile(const std::string& base_image) {
  fs::path runner = SandboxHarness(-1, true);
  fs::path source_dir = SandboxSource(-1, true).parent_path();
  return fmt::format(
      "FROM {0}\n"
      "RUN mkdir -p {1} {2}\n"
      "COPY runner.py {3}\n"
      "RUN chmod 0755 {1} {2} && chmod 0444 {3}\n"
      "USER 65534:65534\n"
      "WORKDIR /tmp\n",
      base_image, runner.parent_path().string(), source_dir.string(), runner.string());
}

std::string JobDockerfile(const std::string& base_tag) {
  return fmt::format("FROM {}\nCOPY main.py {}\n", base_tag, SandboxSource(-1, true).string());
}

std::string HarnessVersion(const std::string& base_image) {
  std::string digest = HashHex(RunnerScript(SandboxSource(-1, true)) + BaseDockerfile(base_image));
  return std::string(kHarnessRevision) + "-" + digest.substr(0, 12);
}
