// config.h - Sandbox configuration model
#pragma once

#include "api_export.h"
#include "output_parser.h"
#include "process_executor.h"
#include "retry_orchestrator.h"
#include "script_template.h"
#include "symbol_policy.h"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace scriptbox {

enum class ExecutionMode {
    Subprocess,   // default, the only mode for untrusted input
    InProcess     // reduced isolation escape hatch
};

SCRIPTBOX_API const char* GetExecutionModeName(ExecutionMode mode);
SCRIPTBOX_API std::optional<ExecutionMode> ParseExecutionMode(const std::string& name);

struct SCRIPTBOX_API ExecutionConfig {
    ExecutionMode mode = ExecutionMode::Subprocess;
    std::string interpreter = "python3";
    std::vector<std::string> interpreter_args;
    HostProfile host = HostProfile::Generic;
    std::string document_name;
    double timeout_seconds = 30.0;
    std::string working_directory;
    std::string temp_directory;
    size_t max_memory_mb = 0;
    size_t max_output_bytes = 4 * 1024 * 1024;
    bool clean_environment = false;
    bool probe_version = false;
};

struct SCRIPTBOX_API RetryConfig {
    int max_attempts = 3;
    int backoff_unit_ms = 1000;
    std::vector<std::string> transient_signatures{"recompute failed"};
};

// Lists extend SymbolPolicy::Default() unless replace_defaults is set
struct SCRIPTBOX_API ValidationConfig {
    PolicyMode mode = PolicyMode::Strict;
    bool block_dunder_attributes = true;
    bool replace_defaults = false;
    std::vector<std::string> allowed_modules;
    std::vector<std::string> blocked_modules;
    std::vector<std::string> allowed_builtins;
    std::vector<std::string> blocked_operations;
    std::vector<std::string> in_process_builtins;
};

struct SCRIPTBOX_API ParserConfig {
    std::vector<std::string> benign_stderr_prefixes = OutputParser::DefaultBenignPrefixes();
};

struct SCRIPTBOX_API ConcurrencyConfig {
    int max_concurrent = 4;
};

struct SCRIPTBOX_API LoggingConfig {
    std::string level = "info";
    std::string file;   // empty = console only
};

struct SCRIPTBOX_API SandboxConfig {
    ExecutionConfig execution;
    RetryConfig retry;
    ValidationConfig validation;
    ParserConfig parser;
    ConcurrencyConfig concurrency;
    LoggingConfig logging;

    SymbolPolicy BuildPolicy() const;
    ProcessOptions BuildProcessOptions() const;
    RetryOptions BuildRetryOptions() const;
    std::chrono::milliseconds GetTimeout() const;
    std::optional<std::string> GetWorkingDirectory() const;
};

} // namespace scriptbox
