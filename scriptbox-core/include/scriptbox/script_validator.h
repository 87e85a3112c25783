// script_validator.h - Static validation of scripts against a symbol policy
#pragma once

#include "api_export.h"
#include "result.h"
#include "symbol_policy.h"
#include <string>

namespace scriptbox {

/**
 * ScriptValidator - AST-based capability check
 *
 * Parses the script with the embedded interpreter's `ast` module and walks
 * every node: imports, calls to bare names, bare name references and
 * attribute access are classified through the SymbolPolicy tables. Nothing
 * in the script is ever executed.
 *
 * Requires a running PythonEngine. Thread-safe; the GIL is taken per call.
 */
class SCRIPTBOX_API ScriptValidator {
public:
    ScriptValidator();
    explicit ScriptValidator(SymbolPolicy policy);

    ValidationResult Validate(const Script& script) const;
    ValidationResult Validate(const std::string& source) const;

    // Validity only
    bool ValidateQuick(const std::string& source) const;

    const SymbolPolicy& GetPolicy() const { return policy_; }
    void SetPolicy(SymbolPolicy policy) { policy_ = std::move(policy); }

private:
    SymbolPolicy policy_;
};

} // namespace scriptbox
