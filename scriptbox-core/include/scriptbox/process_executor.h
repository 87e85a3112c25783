// process_executor.h - Wrapper execution in a separate OS process
#pragma once

#include "api_export.h"
#include "executor.h"
#include "script_template.h"
#include "symbol_policy.h"
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace scriptbox {

struct SCRIPTBOX_API ProcessOptions {
    std::string interpreter = "python3";          // python3, freecadcmd or a FreeCAD AppImage
    std::vector<std::string> interpreter_args;    // inserted before the script path
    HostProfile host = HostProfile::Generic;
    std::string document_name;                    // FreeCAD host only
    std::string temp_directory;                   // empty = system temp dir
    size_t max_memory_mb = 0;                     // RLIMIT_AS in the child, 0 = unlimited
    size_t max_output_bytes = 4 * 1024 * 1024;    // per stream
    bool clean_environment = false;
    bool probe_version = false;                   // report host_version in metadata
};

/**
 * ProcessExecutor - Primary isolation mode
 *
 * Each Execute() call renders the wrapper into a fresh temporary file and
 * runs the interpreter on it in a new process group. stdout and stderr are
 * drained with poll() against the deadline; when it passes, the whole group
 * is killed with SIGKILL and reaped before returning.
 */
class SCRIPTBOX_API ProcessExecutor : public ScriptExecutor {
public:
    ProcessExecutor();
    ProcessExecutor(ProcessOptions options, SymbolPolicy policy);

    ExecutionResult Execute(const ExecutionRequest& request) override;
    const char* GetModeName() const override { return "subprocess"; }

    // Runs `<interpreter> --version`; "FreeCAD 0.21.2" or "Python 3.11.4"
    std::optional<std::string> ProbeVersion(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) const;

    // argv for one run; hosts with their own launcher override this
    virtual std::vector<std::string> BuildCommand(const std::string& script_path) const;
    static bool IsAppImage(const std::string& interpreter);

    const ProcessOptions& GetOptions() const { return options_; }
    const SymbolPolicy& GetPolicy() const { return policy_; }

private:
    ProcessOptions options_;
    SymbolPolicy policy_;
    ScriptTemplate template_;

    std::once_flag probe_once_;
    std::optional<std::string> host_version_;
};

} // namespace scriptbox
