#include "scriptbox/config.h"
#include <algorithm>

namespace scriptbox {

const char* GetExecutionModeName(ExecutionMode mode) {
    return mode == ExecutionMode::InProcess ? "in_process" : "subprocess";
}

std::optional<ExecutionMode> ParseExecutionMode(const std::string& name) {
    if (name == "subprocess") return ExecutionMode::Subprocess;
    if (name == "in_process") return ExecutionMode::InProcess;
    return std::nullopt;
}

SymbolPolicy SandboxConfig::BuildPolicy() const {
    SymbolPolicy policy = validation.replace_defaults ? SymbolPolicy() : SymbolPolicy::Default();

    // Allow first so a name listed on both sides ends up blocked
    for (const auto& module : validation.allowed_modules) {
        policy.AllowModule(module);
    }
    for (const auto& name : validation.allowed_builtins) {
        policy.AllowOperation(name);
    }
    for (const auto& module : validation.blocked_modules) {
        policy.BlockModule(module);
    }
    for (const auto& name : validation.blocked_operations) {
        policy.BlockOperation(name);
    }

    std::vector<std::string> in_process = validation.replace_defaults
        ? std::vector<std::string>()
        : SymbolPolicy::DefaultInProcessBuiltins();
    for (const auto& name : validation.in_process_builtins) {
        if (std::find(in_process.begin(), in_process.end(), name) == in_process.end()) {
            in_process.push_back(name);
        }
    }
    policy.SetInProcessBuiltins(in_process);

    policy.SetMode(validation.mode);
    policy.SetBlockDunderAttributes(validation.block_dunder_attributes);
    return policy;
}

ProcessOptions SandboxConfig::BuildProcessOptions() const {
    ProcessOptions options;
    options.interpreter = execution.interpreter;
    options.interpreter_args = execution.interpreter_args;
    options.host = execution.host;
    options.document_name = execution.document_name;
    options.temp_directory = execution.temp_directory;
    options.max_memory_mb = execution.max_memory_mb;
    options.max_output_bytes = execution.max_output_bytes;
    options.clean_environment = execution.clean_environment;
    options.probe_version = execution.probe_version;
    return options;
}

RetryOptions SandboxConfig::BuildRetryOptions() const {
    RetryOptions options;
    options.max_attempts = retry.max_attempts;
    options.backoff_unit = std::chrono::milliseconds(std::max(0, retry.backoff_unit_ms));
    options.transient_signatures = retry.transient_signatures;
    return options;
}

std::chrono::milliseconds SandboxConfig::GetTimeout() const {
    double seconds = execution.timeout_seconds > 0.0 ? execution.timeout_seconds : 30.0;
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

std::optional<std::string> SandboxConfig::GetWorkingDirectory() const {
    if (execution.working_directory.empty()) {
        return std::nullopt;
    }
    return execution.working_directory;
}

} // namespace scriptbox
