// symbol_policy.h - Data-driven allow/block tables for script validation
#pragma once

#include "api_export.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace scriptbox {

enum class SymbolDecision {
    Allowed,
    Blocked,
    Unknown
};

// Strict: unknown symbols are errors. Permissive: unknown symbols are warnings.
enum class PolicyMode {
    Strict,
    Permissive
};

SCRIPTBOX_API const char* GetDecisionName(SymbolDecision decision);
SCRIPTBOX_API const char* GetPolicyModeName(PolicyMode mode);
SCRIPTBOX_API std::optional<PolicyMode> ParsePolicyMode(const std::string& name);

/**
 * SymbolPolicy - Symbol name to decision tables
 *
 * Two tables are kept:
 * - modules: import roots and dotted module paths
 * - operations: builtins, bare names and attribute names. Calls, name
 *   references and attribute access are all looked up here.
 *
 * Blocked always wins over Allowed when a dotted module path matches both.
 */
class SCRIPTBOX_API SymbolPolicy {
public:
    SymbolPolicy() = default;

    // FreeCAD-oriented defaults (CAD modules and a safe stdlib subset)
    static SymbolPolicy Default();
    static std::vector<std::string> DefaultInProcessBuiltins();

    void SetModuleDecision(const std::string& module, SymbolDecision decision);
    void SetOperationDecision(const std::string& name, SymbolDecision decision);

    void AllowModule(const std::string& module) { SetModuleDecision(module, SymbolDecision::Allowed); }
    void BlockModule(const std::string& module) { SetModuleDecision(module, SymbolDecision::Blocked); }
    void AllowOperation(const std::string& name) { SetOperationDecision(name, SymbolDecision::Allowed); }
    void BlockOperation(const std::string& name) { SetOperationDecision(name, SymbolDecision::Blocked); }

    // Checks every dotted prefix of the module path
    SymbolDecision ClassifyModule(const std::string& dotted_name) const;
    SymbolDecision ClassifyOperation(const std::string& name) const;

    std::vector<std::string> GetModules(SymbolDecision decision) const;
    std::vector<std::string> GetOperations(SymbolDecision decision) const;

    PolicyMode GetMode() const { return mode_; }
    void SetMode(PolicyMode mode) { mode_ = mode; }

    bool BlocksDunderAttributes() const { return block_dunder_attributes_; }
    void SetBlockDunderAttributes(bool block) { block_dunder_attributes_ = block; }

    // Builtins exposed by the reduced-trust in-process mode
    const std::vector<std::string>& GetInProcessBuiltins() const { return in_process_builtins_; }
    void SetInProcessBuiltins(std::vector<std::string> builtins) { in_process_builtins_ = std::move(builtins); }

    static bool IsDunder(const std::string& name);

private:
    std::map<std::string, SymbolDecision> modules_;
    std::map<std::string, SymbolDecision> operations_;
    std::vector<std::string> in_process_builtins_;
    PolicyMode mode_ = PolicyMode::Strict;
    bool block_dunder_attributes_ = true;
};

} // namespace scriptbox
