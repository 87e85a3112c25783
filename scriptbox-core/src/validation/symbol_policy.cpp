// symbol_policy.cpp - Default policy tables and lookups
#include "scriptbox/symbol_policy.h"

namespace scriptbox {

const char* GetDecisionName(SymbolDecision decision) {
    switch (decision) {
        case SymbolDecision::Allowed: return "allowed";
        case SymbolDecision::Blocked: return "blocked";
        case SymbolDecision::Unknown: return "unknown";
        default: return "unknown";
    }
}

const char* GetPolicyModeName(PolicyMode mode) {
    return mode == PolicyMode::Strict ? "strict" : "permissive";
}

std::optional<PolicyMode> ParsePolicyMode(const std::string& name) {
    if (name == "strict") return PolicyMode::Strict;
    if (name == "permissive") return PolicyMode::Permissive;
    return std::nullopt;
}

SymbolPolicy SymbolPolicy::Default() {
    SymbolPolicy policy;

    // CAD host modules
    for (const char* module : {
            "FreeCAD", "Part", "Sketcher", "PartDesign", "Draft", "Arch",
            "Mesh", "Points", "Drawing", "TechDraw", "Path", "Fem",
            "Material", "Units", "Base",
            // Standard library (safe subset)
            "math", "datetime", "json", "re", "itertools", "functools",
            "collections"}) {
        policy.AllowModule(module);
    }

    // Process spawning, raw I/O, networking, serialization, reflection
    for (const char* module : {
            "os", "sys", "subprocess", "shutil", "socket", "urllib", "urllib2",
            "urllib3", "requests", "http", "httplib", "ftplib", "telnetlib",
            "pickle", "shelve", "marshal", "dbm", "sqlite3", "ctypes",
            "multiprocessing", "threading", "importlib", "imp", "inspect",
            "gc", "code", "codeop", "runpy", "pty", "signal",
            "__builtin__", "__builtins__", "builtins"}) {
        policy.BlockModule(module);
    }

    for (const char* name : {
            "abs", "all", "any", "bool", "dict", "divmod", "enumerate",
            "filter", "float", "format", "frozenset", "int", "isinstance",
            "issubclass", "iter", "len", "list", "map", "max", "min", "next",
            "pow", "print", "range", "repr", "reversed", "round", "set",
            "slice", "sorted", "str", "sum", "tuple", "type", "zip",
            "hasattr", "chr", "ord", "object", "super", "property",
            "staticmethod", "classmethod",
            // Dunders exempt from the dunder-attribute rule
            "__init__", "__name__", "__doc__",
            // Exceptions scripts commonly raise or catch
            "Exception", "ArithmeticError", "AssertionError", "AttributeError",
            "IndexError", "KeyError", "NotImplementedError", "RuntimeError",
            "StopIteration", "TypeError", "ValueError", "ZeroDivisionError"}) {
        policy.AllowOperation(name);
    }

    for (const char* name : {
            // Dynamic code evaluation
            "__import__", "compile", "eval", "exec", "execfile", "reload",
            // Raw file I/O and interaction
            "open", "file", "input", "raw_input", "breakpoint", "help",
            "exit", "quit",
            // Reflective access to the global environment
            "vars", "globals", "locals", "dir", "getattr", "setattr",
            "delattr", "__builtins__",
            // Frame, code and traceback introspection
            "gi_frame", "gi_code", "gi_yieldfrom", "cr_frame", "cr_code",
            "cr_await", "ag_frame", "ag_code", "f_back", "f_globals",
            "f_locals", "f_builtins", "f_code", "tb_frame", "tb_next",
            "co_code", "co_consts",
            // Process spawning reached through attributes
            "system", "popen", "fork", "forkpty", "execv", "execve", "execvp",
            "execvpe", "spawnl", "spawnv", "spawnve", "posix_spawn",
            "check_output", "check_call", "Popen"}) {
        policy.BlockOperation(name);
    }

    policy.SetInProcessBuiltins(DefaultInProcessBuiltins());
    return policy;
}

std::vector<std::string> SymbolPolicy::DefaultInProcessBuiltins() {
    return {
        "abs", "all", "any", "bool", "dict", "enumerate", "filter", "float",
        "int", "len", "list", "map", "max", "min", "print", "range", "round",
        "set", "sorted", "str", "sum", "tuple", "type", "zip",
        "Exception", "ValueError", "TypeError", "RuntimeError"
    };
}

void SymbolPolicy::SetModuleDecision(const std::string& module, SymbolDecision decision) {
    if (decision == SymbolDecision::Unknown) {
        modules_.erase(module);
        return;
    }
    modules_[module] = decision;
}

void SymbolPolicy::SetOperationDecision(const std::string& name, SymbolDecision decision) {
    if (decision == SymbolDecision::Unknown) {
        operations_.erase(name);
        return;
    }
    operations_[name] = decision;
}

SymbolDecision SymbolPolicy::ClassifyModule(const std::string& dotted_name) const {
    if (dotted_name.empty()) {
        return SymbolDecision::Unknown;
    }

    bool allowed = false;
    size_t end = 0;
    while (end != std::string::npos) {
        end = dotted_name.find('.', end + 1);
        std::string prefix = dotted_name.substr(0, end);

        auto it = modules_.find(prefix);
        if (it == modules_.end()) {
            continue;
        }
        if (it->second == SymbolDecision::Blocked) {
            return SymbolDecision::Blocked;
        }
        allowed = true;
    }

    return allowed ? SymbolDecision::Allowed : SymbolDecision::Unknown;
}

SymbolDecision SymbolPolicy::ClassifyOperation(const std::string& name) const {
    auto it = operations_.find(name);
    if (it == operations_.end()) {
        return SymbolDecision::Unknown;
    }
    return it->second;
}

std::vector<std::string> SymbolPolicy::GetModules(SymbolDecision decision) const {
    std::vector<std::string> names;
    for (const auto& [name, value] : modules_) {
        if (value == decision) names.push_back(name);
    }
    return names;
}

std::vector<std::string> SymbolPolicy::GetOperations(SymbolDecision decision) const {
    std::vector<std::string> names;
    for (const auto& [name, value] : operations_) {
        if (value == decision) names.push_back(name);
    }
    return names;
}

bool SymbolPolicy::IsDunder(const std::string& name) {
    return name.size() > 4 &&
           name.compare(0, 2, "__") == 0 &&
           name.compare(name.size() - 2, 2, "__") == 0;
}

} // namespace scriptbox
