// script_template.h - Trusted wrapper program around user scripts
#pragma once

#include "api_export.h"
#include "result.h"
#include "symbol_policy.h"
#include <optional>
#include <string>
#include <vector>

namespace scriptbox {

enum class HostProfile {
    Generic,   // plain interpreter, no host document
    FreeCad    // freecadcmd / FreeCAD AppImage with a fresh document
};

SCRIPTBOX_API const char* GetHostProfileName(HostProfile host);
SCRIPTBOX_API std::optional<HostProfile> ParseHostProfile(const std::string& name);

/**
 * ScriptTemplate - Renders the wrapper program
 *
 * The wrapper injects the context, prepares the host, runs the user script
 * with restricted builtins and a guarded __import__, runs the host commit
 * step and reports progress through the marker protocol. The user source is
 * embedded as a string literal and compiled by the wrapper, so it is never
 * re-indented or spliced into wrapper code.
 */
class SCRIPTBOX_API ScriptTemplate {
public:
    struct Options {
        HostProfile host = HostProfile::Generic;
        std::string document_name;          // empty = Design_<timestamp>
        bool reduced_builtins = false;      // in-process mode allow-list
    };

    explicit ScriptTemplate(SymbolPolicy policy);

    std::string Render(const Script& script, const Options& options) const;

    // JSON string literal, which is also a valid Python string literal
    static std::string PythonLiteral(const std::string& text);
    static std::string DefaultDocumentName();

private:
    std::vector<std::string> ExposedBuiltins(bool reduced) const;
    std::string HostPrologue(const std::string& document_name, HostProfile host) const;
    std::string HostCommit(HostProfile host) const;

    SymbolPolicy policy_;
};

} // namespace scriptbox
