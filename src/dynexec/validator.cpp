#include <dynexec/validator.h>

#include <set>
#include <cctype>
#include <algorithm>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace {

const std::vector<std::string> kAllowedModules = {
  "math", "cmath", "random", "statistics", "decimal", "fractions", "numbers",
  "datetime", "time", "calendar",
  "json", "re", "string", "textwrap", "unicodedata",
  "collections", "itertools", "functools", "heapq", "bisect", "copy", "pprint",
  "enum", "dataclasses", "typing",
  "uuid", "hashlib", "hmac", "base64", "binascii",
};

const std::unordered_set<std::string> kDeniedModules = {
  // processes & OS
  "os", "posix", "nt", "sys", "subprocess", "signal", "pty", "tty", "termios",
  "resource", "fcntl", "pwd", "grp", "platform", "sysconfig",
  "multiprocessing", "threading", "_thread", "concurrent", "asyncio",
  // filesystem
  "shutil", "pathlib", "io", "glob", "tempfile", "fileinput", "mmap",
  "shelve", "dbm", "sqlite3", "zipfile", "tarfile",
  // network
  "socket", "socketserver", "ssl", "select", "selectors", "urllib", "http",
  "ftplib", "smtplib", "poplib", "imaplib", "telnetlib", "xmlrpc", "requests",
  "webbrowser",
  // FFI & interpreter internals
  "ctypes", "cffi", "importlib", "imp", "pkgutil", "runpy", "zipimport",
  "builtins", "__builtin__", "code", "codeop", "gc", "inspect",
  "pickle", "cPickle", "marshal",
};

const std::vector<std::string> kAllowedBuiltins = {
  "abs", "all", "any", "ascii", "bin", "bool", "bytearray", "bytes", "callable",
  "chr", "classmethod", "complex", "dict", "divmod", "enumerate", "filter",
  "float", "format", "frozenset", "hasattr", "hash", "hex", "id", "int",
  "isinstance", "issubclass", "iter", "len", "list", "map", "max", "min",
  "next", "object", "oct", "ord", "pow", "print", "property", "range", "repr",
  "reversed", "round", "set", "slice", "sorted", "staticmethod", "str", "sum",
  "super", "tuple", "type", "zip",
  "__build_class__", "NotImplemented", "Ellipsis",
};

// flagged wherever they appear as a plain name (called or not)
const std::unordered_set<std::string> kBlockedCalls = {
  "eval", "exec", "compile", "open", "__import__", "globals", "locals", "vars",
  "breakpoint", "input", "getattr", "setattr", "delattr", "memoryview",
};

// object internals used to climb out of a restricted namespace
const std::unordered_set<std::string> kBlockedAttributes = {
  "__subclasses__", "__globals__", "__builtins__", "__code__", "__closure__",
  "__bases__", "__base__", "__mro__", "__class__", "__dict__", "__getattribute__",
  "__loader__", "__spec__", "__reduce__", "__reduce_ex__",
  "f_globals", "f_locals", "f_builtins", "f_back", "f_code",
  "gi_frame", "gi_code", "cr_frame", "ag_frame", "tb_frame", "co_code",
  // attribute lookup by string, which the scanner cannot follow
  "attrgetter", "methodcaller", "get_field", "get_type_hints", "ForwardRef",
};

// modules re-exported by allowed modules (e.g. random._os)
const std::unordered_set<std::string> kBlockedModuleAttributes = {
  "os", "_os", "sys", "_sys", "subprocess", "builtins", "_builtins",
};

enum class TokenType { NAME, OP, NEWLINE, OTHER };

struct Token {
  TokenType type;
  std::string text;
  size_t pos;
};

inline bool IsIdentStart(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || (unsigned char)c >= 0x80;
}
inline bool IsIdentChar(char c) {
  return IsIdentStart(c) || (c >= '0' && c <= '9');
}
inline bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

inline bool IsStringPrefix(std::string word) {
  if (word.size() > 2) return false;
  std::transform(word.begin(), word.end(), word.begin(), [](unsigned char c) { return std::tolower(c); });
  static const std::set<std::string> kPrefixes = {"r", "u", "f", "b", "br", "rb", "fr", "rf"};
  return kPrefixes.count(word);
}

void Tokenize(const std::string& src, size_t offset, std::vector<Token>& out);

// return the position after the closing quote; f-string bodies are tokenized as code
size_t SkipString(const std::string& src, size_t quote, const std::string& prefix,
                  size_t offset, std::vector<Token>& out) {
  const size_t n = src.size();
  const char q = src[quote];
  const bool triple = quote + 2 < n && src[quote + 1] == q && src[quote + 2] == q;
  const size_t begin = quote + (triple ? 3 : 1);
  size_t i = begin, end = n, body_end = n;
  while (i < n) {
    if (src[i] == '\\') { // also keeps a raw string open
      i += 2;
      continue;
    }
    if (triple && i + 2 < n && src[i] == q && src[i + 1] == q && src[i + 2] == q) {
      body_end = i;
      end = i + 3;
      break;
    }
    if (!triple && src[i] == q) {
      body_end = i;
      end = i + 1;
      break;
    }
    if (!triple && src[i] == '\n') { // unterminated
      body_end = end = i;
      break;
    }
    i++;
  }
  if (body_end > n) body_end = n;
  if (end > n) end = n;
  if (prefix.find_first_of("fF") != std::string::npos && body_end > begin) {
    Tokenize(src.substr(begin, body_end - begin), offset + begin, out);
  }
  return end;
}

void Tokenize(const std::string& src, size_t offset, std::vector<Token>& out) {
  const size_t n = src.size();
  int depth = 0;
  size_t i = 0;
  while (i < n) {
    char c = src[i];
    if (c == '#') {
      while (i < n && src[i] != '\n') i++;
      continue;
    }
    if (c == '\\' && i + 1 < n && (src[i + 1] == '\n' || src[i + 1] == '\r')) { // line continuation
      i += 2;
      if (i < n && src[i - 1] == '\r' && src[i] == '\n') i++;
      continue;
    }
    if (c == '\n' || c == '\r') {
      if (depth == 0) out.push_back({TokenType::NEWLINE, "", offset + i});
      i++;
      continue;
    }
    if (c == ' ' || c == '\t' || c == '\f') {
      i++;
      continue;
    }
    if (IsIdentStart(c)) {
      size_t j = i;
      while (j < n && IsIdentChar(src[j])) j++;
      std::string word = src.substr(i, j - i);
      if (j < n && (src[j] == '\'' || src[j] == '"') && IsStringPrefix(word)) {
        i = SkipString(src, j, word, offset, out);
        continue;
      }
      out.push_back({TokenType::NAME, std::move(word), offset + i});
      i = j;
      continue;
    }
    if (c == '\'' || c == '"') {
      i = SkipString(src, i, "", offset, out);
      continue;
    }
    if (IsDigit(c) || (c == '.' && i + 1 < n && IsDigit(src[i + 1]))) {
      size_t j = i;
      while (j < n && (IsIdentChar(src[j]) || src[j] == '.')) j++;
      out.push_back({TokenType::OTHER, src.substr(i, j - i), offset + i});
      i = j;
      continue;
    }
    if (c == '(' || c == '[' || c == '{') depth++;
    if ((c == ')' || c == ']' || c == '}') && depth > 0) depth--;
    size_t len = 1;
    if (i + 1 < n && src[i + 1] == '=' && std::string("=!<>:+-*/%&|^@").find(c) != std::string::npos) {
      len = 2;
    }
    out.push_back({TokenType::OP, src.substr(i, len), offset + i});
    i += len;
  }
}

struct Finding {
  size_t pos;
  Rule rule;
  std::string fragment;
};

class Scanner {
  const std::vector<Token>& toks_;
  std::vector<Finding>& findings_;

  bool IsOp(size_t k, const char* op) const {
    return k < toks_.size() && toks_[k].type == TokenType::OP && toks_[k].text == op;
  }
  bool IsName(size_t k, const char* name = nullptr) const {
    return k < toks_.size() && toks_[k].type == TokenType::NAME && (!name || toks_[k].text == name);
  }

  void CheckModule(const std::string& module, size_t pos) {
    std::string top = module.substr(0, module.find('.'));
    if (kDeniedModules.count(top)) {
      findings_.push_back({pos, Rule::DENIED_IMPORT, module});
    } else if (std::find(kAllowedModules.begin(), kAllowedModules.end(), top) == kAllowedModules.end()) {
      findings_.push_back({pos, Rule::IMPORT_NOT_ALLOWED, module});
    }
  }

  // dotted name starting at k; return the index after it
  size_t DottedName(size_t k, std::string& name) const {
    name.clear();
    while (IsName(k)) {
      name += toks_[k++].text;
      if (!IsOp(k, ".") || !IsName(k + 1)) break;
      name += '.';
      k++;
    }
    return k;
  }

  // "import a.b as c, d"; k points after "import"
  size_t ImportStatement(size_t k) {
    while (IsName(k)) {
      size_t pos = toks_[k].pos;
      std::string module;
      k = DottedName(k, module);
      CheckModule(module, pos);
      if (IsName(k, "as")) k += 2;
      if (!IsOp(k, ",")) break;
      k++;
    }
    return k;
  }

  // "from x.y import z"; k points after "from"
  // return the index after "import", or k if this is not an import ("yield from", "raise ... from")
  size_t FromImport(size_t k) {
    size_t pos = toks_[k - 1].pos;
    std::string dots;
    size_t j = k;
    while (IsOp(j, ".")) dots += toks_[j++].text;
    std::string module;
    if (!IsName(j, "import")) j = DottedName(j, module); // "from . import x" has no name
    if (!IsName(j, "import") || (dots.empty() && module.empty())) return k;
    if (!dots.empty()) {
      findings_.push_back({pos, Rule::IMPORT_NOT_ALLOWED, "from " + dots + module});
    } else {
      CheckModule(module, toks_[k].pos);
    }
    return j + 1;
  }

 public:
  Scanner(const std::vector<Token>& toks, std::vector<Finding>& findings) :
      toks_(toks), findings_(findings) {}

  void Run() {
    size_t k = 0;
    while (k < toks_.size()) {
      const Token& tok = toks_[k];
      if (tok.type != TokenType::NAME) {
        k++;
        continue;
      }
      bool after_dot = k > 0 && IsOp(k - 1, ".");
      if (!after_dot && tok.text == "import") {
        k = ImportStatement(k + 1);
        continue;
      }
      if (!after_dot && tok.text == "from") {
        k = FromImport(k + 1);
        continue;
      }
      if (kBlockedAttributes.count(tok.text)) {
        findings_.push_back({tok.pos, Rule::BLOCKED_ATTRIBUTE, (after_dot ? "." : "") + tok.text});
      } else if (after_dot && kBlockedModuleAttributes.count(tok.text)) {
        findings_.push_back({tok.pos, Rule::BLOCKED_ATTRIBUTE, "." + tok.text});
      } else if (!after_dot && kBlockedCalls.count(tok.text) && !IsOp(k + 1, "=")) {
        // "open=..." as keyword argument or assignment target is not a use
        findings_.push_back({tok.pos, Rule::BLOCKED_CALL, tok.text + (IsOp(k + 1, "(") ? "(" : "")});
      }
      k++;
    }
  }
};

} // namespace

const char* RuleId(Rule rule) {
  switch (rule) {
#define X(name, id) case Rule::name: return id;
    ENUM_RULE_
#undef X
  }
  __builtin_unreachable();
}

SecurityVerdict Validate(const std::string& source) {
  SecurityVerdict ret;
  auto Reject = [&](Rule rule, std::string fragment) {
    ret.safe = false;
    ret.violations.push_back({RuleId(rule), std::move(fragment)});
  };
  if (source.find_first_not_of(" \t\r\n\f\v") == std::string::npos) {
    Reject(Rule::EMPTY_SOURCE, "");
    return ret;
  }
  if (source.size() > kMaxSourceSize) {
    Reject(Rule::SOURCE_TOO_LARGE, std::to_string(source.size()) + " bytes");
    return ret;
  }

  std::vector<Token> toks;
  Tokenize(source, 0, toks);
  std::vector<Finding> findings;
  Scanner(toks, findings).Run();
  std::stable_sort(findings.begin(), findings.end(),
      [](const Finding& a, const Finding& b) { return a.pos < b.pos; });
  std::set<std::pair<Rule, std::string>> seen;
  for (auto& i : findings) {
    if (!seen.insert({i.rule, i.fragment}).second) continue;
    Reject(i.rule, i.fragment);
  }
  if (!ret.safe) {
    spdlog::info("Source rejected: {} violation(s), first {} '{}'",
                 ret.violations.size(), ret.violations[0].rule_id, ret.violations[0].fragment);
  }
  return ret;
}

const std::vector<std::string>& AllowedModules() {
  return kAllowedModules;
}

const std::vector<std::string>& AllowedBuiltins() {
  return kAllowedBuiltins;
}
