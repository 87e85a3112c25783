#include "scriptbox/script_template.h"
#include "scriptbox/marker_protocol.h"
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace scriptbox {

namespace {

std::string PythonList(const std::vector<std::string>& items) {
    return nlohmann::json(items).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string PythonBool(bool value) {
    return value ? "True" : "False";
}

// Guarded import and restricted builtins. Placeholders are filled by Render().
const char* kSandboxSetup = R"PY(
_EXPOSED_BUILTINS = __EXPOSED_BUILTINS__
_BLOCKED_NAMES = set(__BLOCKED_NAMES__)
_ALLOWED_MODULES = set(__ALLOWED_MODULES__)
_BLOCKED_MODULES = set(__BLOCKED_MODULES__)
_STRICT_IMPORTS = __STRICT_IMPORTS__

def _sandbox_import(name, globals=None, locals=None, fromlist=(), level=0):
    if level != 0:
        raise ImportError("Relative imports are not allowed in sandbox scripts")
    parts = name.split(".")
    prefixes = [".".join(parts[:i + 1]) for i in range(len(parts))]
    if any(p in _BLOCKED_MODULES for p in prefixes):
        raise ImportError(f"Module '{name}' is blocked in sandbox environment")
    if _STRICT_IMPORTS and not any(p in _ALLOWED_MODULES for p in prefixes):
        raise ImportError(f"Module '{name}' is not allowed in sandbox environment")
    return _builtins_module.__import__(name, globals, locals, fromlist, level)

def _sandbox_builtins():
    source = vars(_builtins_module)
    if _EXPOSED_BUILTINS is None:
        exposed = {k: v for k, v in source.items() if k not in _BLOCKED_NAMES}
    else:
        exposed = {k: source[k] for k in _EXPOSED_BUILTINS if k in source}
    exposed["__build_class__"] = source["__build_class__"]
    exposed["__import__"] = _sandbox_import
    return exposed
)PY";

// Keeps caller-supplied text on a single comment line
std::string CommentText(const std::string& text) {
    std::string out = text;
    for (auto& c : out) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    return out;
}

void ReplaceAll(std::string& text, const std::string& placeholder, const std::string& value) {
    size_t pos = 0;
    while ((pos = text.find(placeholder, pos)) != std::string::npos) {
        text.replace(pos, placeholder.size(), value);
        pos += value.size();
    }
}

} // anonymous namespace

const char* GetHostProfileName(HostProfile host) {
    return host == HostProfile::FreeCad ? "freecad" : "generic";
}

std::optional<HostProfile> ParseHostProfile(const std::string& name) {
    if (name == "generic") return HostProfile::Generic;
    if (name == "freecad") return HostProfile::FreeCad;
    return std::nullopt;
}

ScriptTemplate::ScriptTemplate(SymbolPolicy policy)
    : policy_(std::move(policy))
{
}

std::string ScriptTemplate::PythonLiteral(const std::string& text) {
    // JSON escapes (\" \\ \n \t \uXXXX) mean the same thing in Python
    return nlohmann::json(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string ScriptTemplate::DefaultDocumentName() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);

    std::ostringstream oss;
    oss << "Design_" << std::put_time(&utc, "%Y%m%d_%H%M%S");
    return oss.str();
}

std::vector<std::string> ScriptTemplate::ExposedBuiltins(bool reduced) const {
    if (reduced) {
        return policy_.GetInProcessBuiltins();
    }
    return policy_.GetOperations(SymbolDecision::Allowed);
}

std::string ScriptTemplate::HostPrologue(const std::string& document_name, HostProfile host) const {
    if (host == HostProfile::Generic) {
        return "_host_globals = {}\n";
    }

    std::ostringstream out;
    out << "try:\n"
        << "    import FreeCAD as App\n"
        << "    import Part\n"
        << "except ImportError as e:\n"
        << "    print(f\"" << markers::kError << " Failed to import FreeCAD modules: {e}\")\n"
        << "    sys.exit(1)\n"
        << "_host_globals = {\"App\": App, \"FreeCAD\": App, \"Part\": Part}\n"
        << "for _optional in (\"PartDesign\", \"Sketcher\", \"Draft\"):\n"
        << "    try:\n"
        << "        _host_globals[_optional] = __import__(_optional)\n"
        << "    except ImportError:\n"
        << "        pass\n"
        << "try:\n"
        << "    doc = App.newDocument(" << PythonLiteral(document_name) << ")\n"
        << "    print(\"" << markers::kDocumentCreated << " \" + doc.Name)\n"
        << "except Exception as e:\n"
        << "    print(f\"" << markers::kError << " Failed to create document: {e}\")\n"
        << "    sys.exit(1)\n"
        << "_host_globals[\"doc\"] = doc\n";
    return out.str();
}

std::string ScriptTemplate::HostCommit(HostProfile host) const {
    if (host == HostProfile::Generic) {
        return fmt::format("    print(\"{}\")\n", markers::kCompletion);
    }

    std::ostringstream out;
    out << "    if doc.recompute() == -1:\n"
        << "        print(\"" << markers::kError << " Document recompute failed\")\n"
        << "        for obj in doc.Objects:\n"
        << "            if getattr(obj, \"State\", None):\n"
        << "                print(f\"" << markers::kError << " Object '{obj.Label}' has errors (State={obj.State})\")\n"
        << "    else:\n"
        << "        print(\"" << markers::kCompletion << "\")\n"
        << "    for obj in doc.Objects:\n"
        << "        print(f\"" << markers::kEntityCreated << " {obj.Label} ({getattr(obj, 'TypeId', 'Unknown')})\")\n";
    return out.str();
}

std::string ScriptTemplate::Render(const Script& script, const Options& options) const {
    std::string document_name = options.document_name.empty() ? DefaultDocumentName()
                                                               : options.document_name;
    bool permissive = policy_.GetMode() == PolicyMode::Permissive && !options.reduced_builtins;

    std::string setup = kSandboxSetup;
    ReplaceAll(setup, "__EXPOSED_BUILTINS__",
               permissive ? "None" : PythonList(ExposedBuiltins(options.reduced_builtins)));
    ReplaceAll(setup, "__BLOCKED_NAMES__", PythonList(policy_.GetOperations(SymbolDecision::Blocked)));
    ReplaceAll(setup, "__ALLOWED_MODULES__", PythonList(policy_.GetModules(SymbolDecision::Allowed)));
    ReplaceAll(setup, "__BLOCKED_MODULES__", PythonList(policy_.GetModules(SymbolDecision::Blocked)));
    ReplaceAll(setup, "__STRICT_IMPORTS__", PythonBool(!permissive));

    std::string context_json = script.GetContext().dump(-1, ' ', false,
                                                        nlohmann::json::error_handler_t::replace);

    std::ostringstream out;
    out << "# Auto-generated sandbox wrapper\n"
        << "# Host: " << GetHostProfileName(options.host) << "\n"
        << "# Request ID: " << (script.GetRequestId().empty() ? "N/A" : CommentText(script.GetRequestId())) << "\n"
        << "import sys\n"
        << "import json\n"
        << "import traceback\n"
        << "import builtins as _builtins_module\n"
        << "\n"
        << "_context = json.loads(" << PythonLiteral(context_json) << ")\n"
        << "\n"
        << HostPrologue(document_name, options.host)
        << setup
        << "\n"
        << "_SCRIPT_SOURCE = " << PythonLiteral(script.GetText()) << "\n"
        << "_script_globals = {\"__builtins__\": _sandbox_builtins(), \"__name__\": \"__sandbox__\", "
        << "\"_context\": _context}\n"
        << "_script_globals.update(_host_globals)\n"
        << "\n"
        << "print(\"" << markers::kScriptStart << "\")\n"
        << "try:\n"
        << "    exec(compile(_SCRIPT_SOURCE, \"<script>\", \"exec\"), _script_globals)\n"
        << "    print(\"" << markers::kRecomputeStart << "\")\n"
        << HostCommit(options.host)
        << "    print(\"" << markers::kScriptSuccess << "\")\n"
        << "except Exception as e:\n"
        << "    print(\"" << markers::kError << " Script execution failed: \" + \" \".join(str(e).split()))\n"
        << "    traceback.print_exc()\n"
        << "    sys.stdout.flush()\n"
        << "    sys.exit(1)\n"
        << "\n"
        << "print(\"" << markers::kExecutionComplete << "\")\n"
        << "sys.stdout.flush()\n";

    return out.str();
}

} // namespace scriptbox
