#include "scriptbox/script_validator.h"
#include "scriptbox/python_engine.h"
#include <pybind11/pybind11.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <optional>
#include <set>
#include <unordered_set>

namespace py = pybind11;

namespace scriptbox {

namespace {

/**
 * Walks a parsed module and records policy decisions.
 *
 * Two passes: the first collects names the script binds itself (functions,
 * classes, assignments, parameters, import aliases, loop and handler
 * targets) so calls to them are not reported as unknown builtins. The second
 * pass visits every node in field order.
 */
class AstWalker {
public:
    AstWalker(const SymbolPolicy& policy, py::module_ ast)
        : policy_(policy)
        , ast_(std::move(ast))
        , store_type_(ast_.attr("Store"))
    {
    }

    void CollectBindings(py::handle tree) {
        for (auto node : ast_.attr("walk")(tree)) {
            std::string type = NodeType(node);

            if (type == "FunctionDef" || type == "AsyncFunctionDef" || type == "ClassDef") {
                local_names_.insert(node.attr("name").cast<std::string>());
            } else if (type == "Name") {
                if (py::isinstance(node.attr("ctx"), store_type_)) {
                    local_names_.insert(node.attr("id").cast<std::string>());
                }
            } else if (type == "arg") {
                local_names_.insert(node.attr("arg").cast<std::string>());
            } else if (type == "Import" || type == "ImportFrom") {
                for (auto alias : node.attr("names")) {
                    local_names_.insert(BoundImportName(alias));
                }
            } else if (type == "ExceptHandler" || type == "MatchAs" || type == "MatchStar") {
                py::object name = node.attr("name");
                if (!name.is_none()) {
                    local_names_.insert(name.cast<std::string>());
                }
            } else if (type == "Global" || type == "Nonlocal") {
                for (auto name : node.attr("names")) {
                    local_names_.insert(name.cast<std::string>());
                }
            }
        }
    }

    void Visit(py::handle node) {
        std::string type = NodeType(node);

        if (type == "Import") {
            VisitImport(node);
        } else if (type == "ImportFrom") {
            VisitImportFrom(node);
        } else if (type == "Call") {
            VisitCall(node);
            return;  // children handled by VisitCall
        } else if (type == "Name") {
            CheckNameReference(node.attr("id").cast<std::string>(), Line(node));
        } else if (type == "Attribute") {
            CheckAttribute(node);
        } else if (type == "Subscript") {
            CheckSubscriptKey(node);
        }

        VisitChildren(node);
    }

    ValidationResult TakeResult() {
        result_.Finalize();
        return std::move(result_);
    }

private:
    static std::string NodeType(py::handle node) {
        return node.attr("__class__").attr("__name__").cast<std::string>();
    }

    static int Line(py::handle node) {
        py::object lineno = py::getattr(node, "lineno", py::none());
        return lineno.is_none() ? 0 : lineno.cast<int>();
    }

    static std::string BoundImportName(py::handle alias) {
        py::object asname = alias.attr("asname");
        if (!asname.is_none()) {
            return asname.cast<std::string>();
        }
        // "import a.b" binds "a"
        std::string name = alias.attr("name").cast<std::string>();
        return name.substr(0, name.find('.'));
    }

    void VisitChildren(py::handle node) {
        for (auto child : ast_.attr("iter_child_nodes")(node)) {
            Visit(child);
        }
    }

    void VisitImport(py::handle node) {
        for (auto alias : node.attr("names")) {
            CheckModule(alias.attr("name").cast<std::string>());
        }
    }

    void VisitImportFrom(py::handle node) {
        py::object module_obj = node.attr("module");
        std::string module = module_obj.is_none() ? "" : module_obj.cast<std::string>();
        int level = node.attr("level").cast<int>();

        if (level > 0) {
            // Relative imports have no package to resolve against
            CheckModule(std::string(static_cast<size_t>(level), '.') + module);
        } else {
            CheckModule(module);
        }

        int line = Line(node);
        for (auto alias : node.attr("names")) {
            std::string name = alias.attr("name").cast<std::string>();
            if (name == "*") {
                continue;
            }

            bool blocked = policy_.ClassifyOperation(name) == SymbolDecision::Blocked;
            if (!blocked && level == 0 && !module.empty()) {
                blocked = policy_.ClassifyModule(module + "." + name) == SymbolDecision::Blocked;
            }
            if (blocked) {
                AddError(fmt::format("Blocked import name: {} from {} at line {}",
                                     name, module.empty() ? "." : module, line));
                AddBlocked(name);
            }
        }
    }

    void VisitCall(py::handle node) {
        py::object func = node.attr("func");
        if (NodeType(func) == "Name") {
            CheckCall(func.attr("id").cast<std::string>(), Line(func));
        } else {
            Visit(func);
        }

        for (auto arg : node.attr("args")) {
            Visit(arg);
        }
        for (auto keyword : node.attr("keywords")) {
            Visit(keyword);
        }
    }

    void CheckModule(const std::string& module) {
        std::string label = module.empty() ? "." : module;

        switch (module.empty() || module[0] == '.' ? SymbolDecision::Unknown
                                                    : policy_.ClassifyModule(module)) {
            case SymbolDecision::Blocked:
                AddError(fmt::format("Blocked module import: {}", label));
                AddBlocked(label);
                break;
            case SymbolDecision::Allowed:
                AddAllowed(label);
                break;
            case SymbolDecision::Unknown:
                if (policy_.GetMode() == PolicyMode::Strict) {
                    AddError(fmt::format("Unauthorized module: {}", label));
                } else {
                    result_.warnings.push_back(fmt::format("Unusual module import: {}", label));
                }
                break;
        }
    }

    void CheckCall(const std::string& name, int line) {
        switch (policy_.ClassifyOperation(name)) {
            case SymbolDecision::Blocked:
                AddError(fmt::format("Blocked operation: {}() at line {}", name, line));
                AddBlocked(name);
                break;
            case SymbolDecision::Allowed:
                AddAllowed(name);
                break;
            case SymbolDecision::Unknown:
                if (local_names_.count(name) != 0) {
                    break;
                }
                if (policy_.GetMode() == PolicyMode::Strict) {
                    AddError(fmt::format("Unauthorized builtin: {}() at line {}", name, line));
                } else {
                    result_.warnings.push_back(fmt::format("Unknown builtin: {}() at line {}", name, line));
                }
                break;
        }
    }

    void CheckNameReference(const std::string& name, int line) {
        if (policy_.ClassifyOperation(name) == SymbolDecision::Blocked) {
            AddError(fmt::format("Blocked name reference: {} at line {}", name, line));
            AddBlocked(name);
        }
    }

    void CheckAttribute(py::handle node) {
        std::string attr = node.attr("attr").cast<std::string>();
        int line = Line(node);

        SymbolDecision decision = policy_.ClassifyOperation(attr);
        std::string symbol = attr;

        if (decision != SymbolDecision::Blocked) {
            // "os.system" style paths on a name the script never bound
            auto dotted = DottedName(node);
            if (dotted) {
                std::string root = dotted->substr(0, dotted->find('.'));
                if (policy_.ClassifyOperation(*dotted) == SymbolDecision::Blocked ||
                    (local_names_.count(root) == 0 &&
                     policy_.ClassifyModule(*dotted) == SymbolDecision::Blocked)) {
                    decision = SymbolDecision::Blocked;
                    symbol = *dotted;
                }
            }
        }

        if (decision != SymbolDecision::Blocked &&
            decision != SymbolDecision::Allowed &&
            policy_.BlocksDunderAttributes() && SymbolPolicy::IsDunder(attr)) {
            decision = SymbolDecision::Blocked;
        }

        if (decision == SymbolDecision::Blocked) {
            AddError(fmt::format("Blocked attribute access: {} at line {}", symbol, line));
            AddBlocked(symbol);
        }
    }

    // d['__import__'] on a builtins or namespace dict
    void CheckSubscriptKey(py::handle node) {
        py::object key = node.attr("slice");
        if (NodeType(key) == "Index") {
            key = key.attr("value");  // Python < 3.9 wraps the key
        }
        if (NodeType(key) != "Constant" || !py::isinstance<py::str>(key.attr("value"))) {
            return;
        }

        std::string name = key.attr("value").cast<std::string>();
        if (!SymbolPolicy::IsDunder(name)) {
            return;
        }

        SymbolDecision decision = policy_.ClassifyOperation(name);
        if (decision == SymbolDecision::Blocked ||
            (decision != SymbolDecision::Allowed && policy_.BlocksDunderAttributes())) {
            AddError(fmt::format("Blocked subscript key: {} at line {}", name, Line(node)));
            AddBlocked(name);
        }
    }

    // "a.b.c" for Name/Attribute chains, nullopt otherwise
    static std::optional<std::string> DottedName(py::handle node) {
        std::string type = NodeType(node);
        if (type == "Name") {
            return node.attr("id").cast<std::string>();
        }
        if (type == "Attribute") {
            auto base = DottedName(node.attr("value"));
            if (base) {
                return *base + "." + node.attr("attr").cast<std::string>();
            }
        }
        return std::nullopt;
    }

    void AddError(std::string message) {
        result_.errors.push_back(std::move(message));
    }

    void AddAllowed(const std::string& symbol) {
        if (allowed_seen_.insert(symbol).second) {
            result_.allowed_symbols.push_back(symbol);
        }
    }

    void AddBlocked(const std::string& symbol) {
        if (blocked_seen_.insert(symbol).second) {
            result_.blocked_symbols.push_back(symbol);
        }
    }

    const SymbolPolicy& policy_;
    py::module_ ast_;
    py::object store_type_;

    std::unordered_set<std::string> local_names_;
    std::set<std::string> allowed_seen_;
    std::set<std::string> blocked_seen_;
    ValidationResult result_;
};

} // anonymous namespace

ScriptValidator::ScriptValidator()
    : policy_(SymbolPolicy::Default())
{
}

ScriptValidator::ScriptValidator(SymbolPolicy policy)
    : policy_(std::move(policy))
{
}

ValidationResult ScriptValidator::Validate(const Script& script) const {
    return Validate(script.GetText());
}

ValidationResult ScriptValidator::Validate(const std::string& source) const {
    if (!PythonEngine::IsInterpreterRunning()) {
        spdlog::error("ScriptValidator: Python runtime not initialized");
        ValidationResult result;
        result.errors.push_back("Validator unavailable: Python runtime not initialized");
        result.Finalize();
        return result;
    }

    py::gil_scoped_acquire acquire;

    try {
        py::module_ ast = py::module_::import("ast");

        // Parse the code into an AST
        py::object tree;
        try {
            tree = ast.attr("parse")(py::bytes(source), "<script>", "exec");
        } catch (py::error_already_set& e) {
            std::string message = e.what();
            int line = 0;
            if (e.matches(PyExc_SyntaxError)) {
                py::object value = e.value();
                py::object msg = py::getattr(value, "msg", py::none());
                py::object lineno = py::getattr(value, "lineno", py::none());
                if (!msg.is_none()) message = py::str(msg).cast<std::string>();
                if (!lineno.is_none()) line = lineno.cast<int>();
            }
            spdlog::warn("ScriptValidator: syntax error at line {}: {}", line, message);
            return ValidationResult::SyntaxError(message, line);
        }

        AstWalker walker(policy_, ast);
        walker.CollectBindings(tree);
        walker.Visit(tree);

        ValidationResult result = walker.TakeResult();
        if (result.valid) {
            spdlog::debug("ScriptValidator: script passed ({} allowed symbols, {} warnings)",
                          result.allowed_symbols.size(), result.warnings.size());
        } else {
            spdlog::warn("ScriptValidator: script rejected with {} error(s), first: {}",
                         result.errors.size(), result.errors.front());
        }
        return result;

    } catch (const py::error_already_set& e) {
        // Fail closed: a walk that cannot complete is not a pass
        spdlog::error("ScriptValidator: AST analysis error: {}", e.what());
        ValidationResult result;
        result.errors.push_back(std::string("AST analysis failed: ") + e.what());
        result.Finalize();
        return result;
    } catch (const py::cast_error& e) {
        spdlog::error("ScriptValidator: unexpected AST shape: {}", e.what());
        ValidationResult result;
        result.errors.push_back(std::string("AST analysis failed: ") + e.what());
        result.Finalize();
        return result;
    }
}

bool ScriptValidator::ValidateQuick(const std::string& source) const {
    return Validate(source).valid;
}

} // namespace scriptbox
