#include <codebox/validator.h>

#include <deque>
#include <cctype>
#include <cstring>
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include <codebox/namespace.h>
#include "parser.h"

namespace {

using Names = std::unordered_set<std::string>;

const Names kDynamicEvalNames = {
  "eval", "exec", "compile", "__import__", "getattr", "setattr", "delattr", "hasattr",
  "globals", "locals", "vars", "dir", "breakpoint", "memoryview", "help",
  "importlib", "builtins", "inspect", "gc", "types", "ctypes", "code", "codeop",
};
const Names kFilesystemNames = {
  "open", "input", "exit", "quit", "os", "sys", "subprocess", "socket", "shutil", "pathlib",
  "multiprocessing", "threading", "signal", "urllib", "requests", "http", "ftplib",
  "tempfile", "glob", "fcntl", "resource", "pty", "platform", "asyncio", "webbrowser",
  "sqlite3", "mmap", "io",
};
const Names kDeserializationNames = {
  "pickle", "cPickle", "cloudpickle", "marshal", "shelve", "dill", "joblib",
};

const Names kFrameAttributes = {
  "gi_frame", "gi_code", "gi_yieldfrom", "cr_frame", "cr_code", "cr_await", "ag_frame",
  "ag_code", "f_globals", "f_locals", "f_builtins", "f_back", "f_code", "f_trace",
  "tb_frame", "tb_next", "co_code", "co_consts", "co_names", "func_globals", "func_code",
  "im_func", "im_self", "mro",
};
const Names kEvaluatorAttributes = {"eval", "query"};
const Names kFormatAttributes = {"format", "format_map"};
const Names kDeserializationAttributes = {"read_pickle", "to_pickle", "load", "dump"};
const Names kFilesystemAttributes = {
  "system", "popen", "spawn", "spawnl", "spawnv", "execl", "execv", "execve", "execvp",
  "fork", "kill", "remove", "unlink", "rmdir", "rmtree", "removedirs", "mkdir", "makedirs",
  "rename", "chmod", "chown", "listdir", "scandir", "walk", "chdir", "getcwd", "environ",
  "urlopen", "urlretrieve", "connect", "open", "touch",
  "read_text", "read_bytes", "write_text", "write_bytes",
  "read_csv", "read_excel", "read_json", "read_parquet", "read_sql", "read_sql_query",
  "read_sql_table", "read_table", "read_fwf", "read_hdf", "read_html", "read_xml",
  "read_feather", "read_orc", "read_sas", "read_spss", "read_stata", "read_clipboard",
  "fromfile", "fromregex", "tofile", "savetxt", "loadtxt", "genfromtxt", "save", "savez",
  "savez_compressed", "memmap", "DataSource", "to_sql", "to_clipboard",
};
// allowed only when called without a destination: df.to_csv(index=False) returns text
const Names kWriterAttributes = {
  "to_csv", "to_json", "to_excel", "to_parquet", "to_hdf", "to_feather", "to_html",
  "to_latex", "to_markdown", "to_stata", "to_xml", "to_orc", "to_string",
};
// pandas resolves a string argument of these to a method of the receiver
const Names kDispatchAttributes = {"agg", "aggregate", "apply", "applymap", "map", "transform"};
const Names kPathKeywords = {
  "path_or_buf", "path_or_buffer", "path", "buf", "excel_writer", "fname", "file",
  "filename", "con",
};

inline bool IsDunder(const std::string& name) {
  return name.size() > 4 && name.compare(0, 2, "__") == 0 &&
         name.compare(name.size() - 2, 2, "__") == 0;
}

// literal templates whose replacement fields only name or number arguments
bool IsPlainTemplate(const std::string& str) {
  for (size_t i = 0, n = str.size(); i < n;) {
    if (str[i] != '{') {
      i++;
      continue;
    }
    if (i + 1 < n && str[i + 1] == '{') {
      i += 2;
      continue;
    }
    size_t j = i + 1;
    while (j < n && !std::strchr("}!:{", str[j])) j++;
    for (size_t k = i + 1; k < j; k++) {
      unsigned char c = str[k];
      if (c >= 0x80 || !(std::isalnum(c) || c == '_')) return false;
    }
    i = j;
  }
  return true;
}

// rule broken by reaching attribute `name` through string dispatch
bool BlockedMethodName(const std::string& name, ViolationRule& rule) {
  if (name.empty()) return false;
  if (name[0] == '_' || kFrameAttributes.count(name) || kEvaluatorAttributes.count(name) ||
      kFormatAttributes.count(name)) {
    rule = ViolationRule::DYNAMIC_EVAL;
  } else if (kDeserializationAttributes.count(name)) {
    rule = ViolationRule::UNSAFE_DESERIALIZATION;
  } else if (kFilesystemAttributes.count(name) || kWriterAttributes.count(name)) {
    rule = ViolationRule::FILESYSTEM_PROCESS;
  } else {
    return false;
  }
  return true;
}

enum class ScopeKind { MODULE, FUNCTION, CLASS, COMPREHENSION };

struct Scope {
  ScopeKind kind;
  Scope* parent;
  Names bound, globals, nonlocals;
};

class Validator {
 public:
  Validator() {
    scopes_.push_back({ScopeKind::MODULE, nullptr, {}, {}, {}});
    module_ = &scopes_.back();
  }

  std::vector<Violation> Run(const Node& mod) {
    collect_ = true;
    Walk(mod, module_);
    collect_ = false;
    Walk(mod, module_);

    std::stable_sort(violations_.begin(), violations_.end(), [](const Violation& a, const Violation& b) {
      return std::make_pair(a.line, (int)a.rule) < std::make_pair(b.line, (int)b.rule);
    });
    std::vector<Violation> ret;
    for (auto& i : violations_) {
      if (!ret.empty() && ret.back().line == i.line && ret.back().rule == i.rule) continue;
      ret.push_back(std::move(i));
    }
    return ret;
  }

 private:
  bool collect_;
  std::deque<Scope> scopes_;
  Scope* module_;
  std::unordered_map<const Node*, Scope*> scope_of_;
  std::unordered_map<const Node*, const Node*> call_of_; // callee attribute -> call
  std::unordered_set<const Node*> chain_checked_;
  std::vector<Violation> violations_;

  void Report(ViolationRule rule, int line, std::string msg) {
    violations_.push_back({rule, line, std::move(msg)});
  }

  /// scopes
  Scope* Enter(const Node& node, ScopeKind kind, Scope* parent) {
    if (!collect_) return scope_of_.at(&node);
    scopes_.push_back({kind, parent, {}, {}, {}});
    scope_of_[&node] = &scopes_.back();
    return &scopes_.back();
  }

  void Bind(Scope* scope, const std::string& name) {
    if (scope->globals.count(name)) {
      module_->bound.insert(name);
    } else if (!scope->nonlocals.count(name)) {
      scope->bound.insert(name);
    }
  }

  static Scope* WalrusScope(Scope* scope) {
    while (scope->kind == ScopeKind::COMPREHENSION) scope = scope->parent;
    return scope;
  }

  // class bodies are invisible to the scopes nested in them
  static bool Resolves(const std::string& name, Scope* scope) {
    for (Scope* s = scope; s; s = s->parent) {
      if (s != scope && s->kind == ScopeKind::CLASS) continue;
      if (s->bound.count(name)) return true;
    }
    return false;
  }

  /// traversal shared by both passes
  void Walk(const Node& node, Scope* scope) {
    Visit(node, scope);
    switch (node.kind) {
      case NodeKind::FUNCTION_DEF: {
        Scope* inner = Enter(node, ScopeKind::FUNCTION, scope);
        for (auto& i : node.children) {
          switch (i->kind) {
            case NodeKind::ARGUMENTS: WalkArguments(*i, scope, inner); break;
            case NodeKind::BLOCK: Walk(*i, inner); break;
            default: Walk(*i, scope); break; // decorators, return annotation
          }
        }
        return;
      }
      case NodeKind::LAMBDA: {
        Scope* inner = Enter(node, ScopeKind::FUNCTION, scope);
        WalkArguments(*node.children[0], scope, inner);
        Walk(*node.children[1], inner);
        return;
      }
      case NodeKind::CLASS_DEF: {
        Scope* inner = Enter(node, ScopeKind::CLASS, scope);
        for (auto& i : node.children) Walk(*i, i->kind == NodeKind::BLOCK ? inner : scope);
        return;
      }
      case NodeKind::LIST_COMP: [[fallthrough]];
      case NodeKind::SET_COMP: [[fallthrough]];
      case NodeKind::DICT_COMP: [[fallthrough]];
      case NodeKind::GENERATOR_EXP: {
        Scope* inner = Enter(node, ScopeKind::COMPREHENSION, scope);
        bool first = true;
        for (auto& i : node.children) {
          if (i->kind != NodeKind::COMPREHENSION) {
            Walk(*i, inner);
            continue;
          }
          // the outermost iterable is evaluated in the enclosing scope
          Visit(*i, inner);
          for (size_t j = 0; j < i->children.size(); j++) {
            Walk(*i->children[j], j == 1 && first ? scope : inner);
          }
          first = false;
        }
        return;
      }
      case NodeKind::NAMED_EXPR: {
        Visit(*node.children[0], WalrusScope(scope));
        Walk(*node.children[1], scope);
        return;
      }
      default:
        for (auto& i : node.children) Walk(*i, scope);
    }
  }

  void WalkArguments(const Node& args, Scope* outer, Scope* inner) {
    for (auto& param : args.children) {
      Visit(*param, inner);
      for (auto& i : param->children) Walk(*i, outer); // annotations and defaults
    }
  }

  void Visit(const Node& node, Scope* scope) {
    if (collect_) {
      Collect(node, scope);
    } else {
      Check(node, scope);
    }
  }

  /// pass 1: bindings
  void Collect(const Node& node, Scope* scope) {
    switch (node.kind) {
      case NodeKind::NAME:
        if (node.ctx != NameContext::LOAD) Bind(scope, node.text);
        break;
      case NodeKind::FUNCTION_DEF: [[fallthrough]];
      case NodeKind::CLASS_DEF: [[fallthrough]];
      case NodeKind::PARAM:
        Bind(scope, node.text);
        break;
      case NodeKind::HANDLER:
        if (!node.text.empty()) Bind(scope, node.text);
        break;
      case NodeKind::IMPORT: [[fallthrough]];
      case NodeKind::IMPORT_FROM:
        // bound so that a rejected import does not also report every use of it
        for (auto& alias : node.children) {
          if (alias->text == "*") continue;
          if (auto as = alias->Find(NodeKind::IDENTIFIER)) {
            Bind(scope, as->text);
          } else {
            Bind(scope, alias->text.substr(0, alias->text.find('.')));
          }
        }
        break;
      case NodeKind::GLOBAL:
        for (auto& i : node.children) scope->globals.insert(i->text);
        break;
      case NodeKind::NONLOCAL:
        for (auto& i : node.children) scope->nonlocals.insert(i->text);
        break;
      default:
        break;
    }
  }

  /// pass 2: rules
  void Check(const Node& node, Scope* scope) {
    switch (node.kind) {
      case NodeKind::IMPORT: [[fallthrough]];
      case NodeKind::IMPORT_FROM: {
        std::string module = node.kind == NodeKind::IMPORT_FROM ? node.text : node.children[0]->text;
        Report(ViolationRule::IMPORT, node.line,
               "import of '" + module + "' is not allowed; the available libraries are pre-bound");
        break;
      }
      case NodeKind::NAME:
        CheckName(node, scope);
        break;
      case NodeKind::FUNCTION_DEF:
        if (node.is_async) Report(ViolationRule::UNSUPPORTED, node.line, "async functions are not supported");
        // special methods may be defined in a class body; they are never reachable by name
        if (scope->kind != ScopeKind::CLASS) CheckBindingName(node);
        break;
      case NodeKind::CLASS_DEF: [[fallthrough]];
      case NodeKind::PARAM: [[fallthrough]];
      case NodeKind::HANDLER:
        CheckBindingName(node);
        break;
      case NodeKind::FOR: [[fallthrough]];
      case NodeKind::WITH: [[fallthrough]];
      case NodeKind::COMPREHENSION:
        if (node.is_async) Report(ViolationRule::UNSUPPORTED, node.line, "async iteration is not supported");
        break;
      case NodeKind::AWAIT:
        Report(ViolationRule::UNSUPPORTED, node.line, "await is not supported");
        break;
      case NodeKind::CALL: {
        const Node& func = *node.children[0];
        if (func.kind != NodeKind::ATTRIBUTE) break;
        call_of_[&func] = &node;
        if (kDispatchAttributes.count(func.text)) {
          for (size_t i = 1; i < node.children.size(); i++) CheckDispatchArgument(*node.children[i], func.text);
        }
        break;
      }
      case NodeKind::ATTRIBUTE:
        CheckAttribute(node, scope);
        break;
      default:
        break;
    }
  }

  void CheckBindingName(const Node& node) {
    if (IsDunder(node.text)) {
      Report(ViolationRule::DYNAMIC_EVAL, node.line, "special name '" + node.text + "' is not allowed");
    }
  }

  void CheckName(const Node& node, Scope* scope) {
    const std::string& name = node.text;
    if (kDynamicEvalNames.count(name)) {
      Report(ViolationRule::DYNAMIC_EVAL, node.line, "'" + name + "' is not allowed");
    } else if (IsDunder(name) && name != "__name__") {
      Report(ViolationRule::DYNAMIC_EVAL, node.line, "special name '" + name + "' is not allowed");
    } else if (kFilesystemNames.count(name)) {
      Report(ViolationRule::FILESYSTEM_PROCESS, node.line, "'" + name + "' is not allowed");
    } else if (kDeserializationNames.count(name)) {
      Report(ViolationRule::UNSAFE_DESERIALIZATION, node.line, "'" + name + "' is not allowed");
    } else if (node.ctx == NameContext::LOAD && !Resolves(name, scope) && !AllowedNames().count(name)) {
      Report(ViolationRule::UNKNOWN_NAME, node.line, "name '" + name + "' is not defined");
    }
  }

  void CheckAttribute(const Node& node, Scope* scope) {
    const std::string& attr = node.text;
    const Node& value = *node.children[0];
    if (attr[0] == '_') {
      Report(ViolationRule::DYNAMIC_EVAL, node.line, "access to private attribute '." + attr + "'");
    } else if (kFrameAttributes.count(attr)) {
      Report(ViolationRule::DYNAMIC_EVAL, node.line, "introspection attribute '." + attr + "' is not allowed");
    } else if (kEvaluatorAttributes.count(attr)) {
      Report(ViolationRule::DYNAMIC_EVAL, node.line, "string expression evaluator '." + attr + "' is not allowed");
    } else if (kFormatAttributes.count(attr)) {
      if (value.kind != NodeKind::STRING || !IsPlainTemplate(value.text)) {
        Report(ViolationRule::DYNAMIC_EVAL, node.line,
               "'." + attr + "' is only allowed on a literal template without attribute or index fields");
      }
    } else if (kDeserializationAttributes.count(attr)) {
      Report(ViolationRule::UNSAFE_DESERIALIZATION, node.line, "'." + attr + "' is not allowed");
    } else if (kFilesystemAttributes.count(attr)) {
      Report(ViolationRule::FILESYSTEM_PROCESS, node.line, "'." + attr + "' is not allowed");
    } else if (kWriterAttributes.count(attr) && !IsPathlessCall(node)) {
      Report(ViolationRule::FILESYSTEM_PROCESS, node.line,
             "'." + attr + "' may only be called without a destination; use upload_result");
    }
    CheckHandleChain(node, scope);
  }

  // df.agg('to_pickle', path) reaches the method by name
  void CheckDispatchArgument(const Node& arg, const std::string& method) {
    switch (arg.kind) {
      case NodeKind::STRING: {
        ViolationRule rule;
        if (BlockedMethodName(arg.text, rule)) {
          Report(rule, arg.line, "'." + method + "' may not dispatch to '" + arg.text + "'");
        }
        return;
      }
      case NodeKind::FSTRING:
        Report(ViolationRule::DYNAMIC_EVAL, arg.line, "'." + method + "' may not dispatch to a computed name");
        return;
      case NodeKind::BINOP:
        for (auto& i : arg.children) {
          if (i->kind == NodeKind::STRING || i->kind == NodeKind::FSTRING) {
            Report(ViolationRule::DYNAMIC_EVAL, arg.line, "'." + method + "' may not dispatch to a computed name");
            return;
          }
        }
        [[fallthrough]];
      case NodeKind::KEYWORD: [[fallthrough]];
      case NodeKind::STARRED: [[fallthrough]];
      case NodeKind::TUPLE: [[fallthrough]];
      case NodeKind::LIST: [[fallthrough]];
      case NodeKind::SET: [[fallthrough]];
      case NodeKind::DICT:
        for (auto& i : arg.children) CheckDispatchArgument(*i, method);
        return;
      default:
        return;
    }
  }

  bool IsPathlessCall(const Node& attr) const {
    auto it = call_of_.find(&attr);
    if (it == call_of_.end()) return false;
    const Node& call = *it->second;
    for (size_t i = 1; i < call.children.size(); i++) {
      const Node& arg = *call.children[i];
      if (arg.kind != NodeKind::KEYWORD) return false;
      if (arg.text.empty() || kPathKeywords.count(arg.text)) return false;
    }
    return true;
  }

  // np.linalg.norm: every step must be an enumerated member or lead to one
  void CheckHandleChain(const Node& node, Scope* scope) {
    if (chain_checked_.count(&node)) return;
    std::vector<const Node*> chain;
    const Node* cur = &node;
    while (cur->kind == NodeKind::ATTRIBUTE) {
      chain_checked_.insert(cur);
      chain.push_back(cur);
      cur = cur->children[0].get();
    }
    if (cur->kind != NodeKind::NAME || Resolves(cur->text, scope)) return;
    const Capability* cap = FindCapability(cur->text);
    if (!cap || cap->kind != CapabilityKind::LIBRARY) return;
    std::string path;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
      path += (path.empty() ? "" : ".") + (*it)->text;
      bool exact = false, prefix = false;
      for (auto& member : cap->members) {
        if (member == path) {
          exact = true;
          break;
        }
        if (member.size() > path.size() && member.compare(0, path.size(), path) == 0 &&
            member[path.size()] == '.') {
          prefix = true;
        }
      }
      if (exact) return;
      if (!prefix) {
        Report(ViolationRule::RESTRICTED_MEMBER, (*it)->line,
               "'" + cap->name + "." + path + "' is not an exposed member of '" + cap->name + "'");
        return;
      }
    }
  }
};

} // namespace

ValidationVerdict Validate(const std::string& source) {
  ValidationVerdict verdict;
  NodePtr mod;
  try {
    mod = Parse(source);
  } catch (ParseError& err) {
    verdict.violations.push_back({ViolationRule::SYNTAX_ERROR, err.line, err.what()});
    return verdict;
  }
  verdict.violations = Validator().Run(*mod);
  verdict.accepted = verdict.violations.empty();
  return verdict;
}
