// in_process_executor.h - Reduced-isolation execution inside the embedded interpreter
#pragma once

#include "api_export.h"
#include "executor.h"
#include "script_template.h"
#include "symbol_policy.h"
#include <mutex>
#include <string>

namespace scriptbox {

/**
 * InProcessExecutor - Opt-in escape hatch
 *
 * Runs the same wrapper program as ProcessExecutor, but inside the embedded
 * interpreter owned by PythonEngine:
 * - builtins come from the narrower in-process allow-list
 * - the guarded __import__ only admits policy-allowed modules
 * - sys.stdout / sys.stderr are redirected to io.StringIO
 * - a sys.settrace watchdog raises a BaseException-derived timeout
 *
 * Nothing stops native code or a bare `except:` in the script from outliving
 * the deadline, so this mode must not be used for untrusted input. Runs are
 * serialized because stream redirection is interpreter-global.
 */
class SCRIPTBOX_API InProcessExecutor : public ScriptExecutor {
public:
    InProcessExecutor();
    explicit InProcessExecutor(SymbolPolicy policy,
                               HostProfile host = HostProfile::Generic,
                               std::string document_name = "");

    ExecutionResult Execute(const ExecutionRequest& request) override;
    const char* GetModeName() const override { return "in_process"; }

    static constexpr const char* kIsolationWarning =
        "In-process execution has reduced isolation and is unsuitable for untrusted input";

private:
    SymbolPolicy policy_;
    HostProfile host_;
    std::string document_name_;
    ScriptTemplate template_;
    std::mutex run_mutex_;
};

} // namespace scriptbox
