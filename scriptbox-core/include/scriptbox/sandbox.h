// sandbox.h - Validate-then-execute facade
#pragma once

#include "api_export.h"
#include "config.h"
#include "execution_slots.h"
#include "executor.h"
#include "result.h"
#include "retry_orchestrator.h"
#include "script_validator.h"
#include <memory>
#include <optional>

namespace scriptbox {

struct SCRIPTBOX_API SandboxOutcome {
    ValidationResult validation;
    std::optional<ExecutionResult> execution;   // absent when validation failed
};

/**
 * ScriptSandbox - Top-level entry point
 *
 * Run() validates the script and, only if it is valid, takes an execution
 * slot and hands it to the RetryOrchestrator. The slot is held across every
 * attempt of the run; time spent waiting for it is reported as
 * metadata.queue_wait_ms and is not charged against the timeout.
 *
 * Slots are owned by the sandbox unless a shared ExecutionSlots is passed in,
 * in which case several sandboxes draw from the same cap.
 */
class SCRIPTBOX_API ScriptSandbox {
public:
    explicit ScriptSandbox(SandboxConfig config = SandboxConfig(),
                           std::shared_ptr<ExecutionSlots> slots = nullptr);

    // Custom execution strategy
    ScriptSandbox(SandboxConfig config,
                  std::unique_ptr<ScriptExecutor> executor,
                  std::shared_ptr<ExecutionSlots> slots = nullptr);

    ScriptSandbox(const ScriptSandbox&) = delete;
    ScriptSandbox& operator=(const ScriptSandbox&) = delete;

    SandboxOutcome Run(const Script& script);

    // Folds a validation failure into a ValidationFailed result
    ExecutionResult Execute(const Script& script);

    ValidationResult Validate(const Script& script) const;

    const SandboxConfig& GetConfig() const { return config_; }
    const std::shared_ptr<ExecutionSlots>& GetSlots() const { return slots_; }
    ScriptExecutor& GetExecutor() { return *executor_; }

    void SetSleeper(RetryOrchestrator::Sleeper sleeper) { orchestrator_.SetSleeper(std::move(sleeper)); }

    static std::unique_ptr<ScriptExecutor> CreateExecutor(const SandboxConfig& config,
                                                          const SymbolPolicy& policy);

private:
    SandboxConfig config_;
    ScriptValidator validator_;
    std::unique_ptr<ScriptExecutor> executor_;
    std::shared_ptr<ExecutionSlots> slots_;
    RetryOrchestrator orchestrator_;
};

} // namespace scriptbox
