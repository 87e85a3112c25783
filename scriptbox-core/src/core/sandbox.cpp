#include "scriptbox/sandbox.h"
#include "scriptbox/in_process_executor.h"
#include "scriptbox/process_executor.h"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace scriptbox {

namespace {

std::shared_ptr<ExecutionSlots> SlotsOrDefault(std::shared_ptr<ExecutionSlots> slots, int capacity) {
    if (slots) {
        return slots;
    }
    return std::make_shared<ExecutionSlots>(capacity > 0 ? static_cast<size_t>(capacity) : 1);
}

std::string JoinErrors(const std::vector<std::string>& errors) {
    std::string joined;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += errors[i];
    }
    return joined;
}

} // anonymous namespace

std::unique_ptr<ScriptExecutor> ScriptSandbox::CreateExecutor(const SandboxConfig& config,
                                                              const SymbolPolicy& policy) {
    if (config.execution.mode == ExecutionMode::InProcess) {
        spdlog::warn("ScriptSandbox: in-process execution selected, isolation is reduced");
        return std::make_unique<InProcessExecutor>(policy, config.execution.host,
                                                   config.execution.document_name);
    }
    return std::make_unique<ProcessExecutor>(config.BuildProcessOptions(), policy);
}

ScriptSandbox::ScriptSandbox(SandboxConfig config, std::shared_ptr<ExecutionSlots> slots)
    : config_(std::move(config))
    , validator_(config_.BuildPolicy())
    , executor_(CreateExecutor(config_, validator_.GetPolicy()))
    , slots_(SlotsOrDefault(std::move(slots), config_.concurrency.max_concurrent))
    , orchestrator_(*executor_, OutputParser(config_.parser.benign_stderr_prefixes),
                    config_.BuildRetryOptions())
{
    spdlog::debug("ScriptSandbox: mode={}, policy={}, slots={}",
                  executor_->GetModeName(), GetPolicyModeName(validator_.GetPolicy().GetMode()),
                  slots_->GetCapacity());
}

ScriptSandbox::ScriptSandbox(SandboxConfig config,
                             std::unique_ptr<ScriptExecutor> executor,
                             std::shared_ptr<ExecutionSlots> slots)
    : config_(std::move(config))
    , validator_(config_.BuildPolicy())
    , executor_(executor ? std::move(executor) : CreateExecutor(config_, validator_.GetPolicy()))
    , slots_(SlotsOrDefault(std::move(slots), config_.concurrency.max_concurrent))
    , orchestrator_(*executor_, OutputParser(config_.parser.benign_stderr_prefixes),
                    config_.BuildRetryOptions())
{
}

ValidationResult ScriptSandbox::Validate(const Script& script) const {
    return validator_.Validate(script);
}

SandboxOutcome ScriptSandbox::Run(const Script& script) {
    SandboxOutcome outcome;
    outcome.validation = validator_.Validate(script);

    if (!outcome.validation.valid) {
        spdlog::warn("ScriptSandbox: script rejected{} ({} errors)",
                     script.GetRequestId().empty() ? "" : fmt::format(" [{}]", script.GetRequestId()),
                     outcome.validation.errors.size());
        return outcome;
    }

    ExecutionSlots::Permit permit = slots_->Acquire();

    ExecutionResult result = orchestrator_.Run(script, config_.retry.max_attempts,
                                               config_.GetTimeout(), config_.GetWorkingDirectory());

    result.metadata["queue_wait_ms"] = permit.GetWaitTime().count();
    if (!script.GetRequestId().empty()) {
        result.metadata["request_id"] = script.GetRequestId();
    }
    if (!outcome.validation.warnings.empty()) {
        result.metadata["validation_warnings"] = outcome.validation.warnings;
    }

    outcome.execution = std::move(result);
    return outcome;
}

ExecutionResult ScriptSandbox::Execute(const Script& script) {
    SandboxOutcome outcome = Run(script);
    if (outcome.execution) {
        return std::move(*outcome.execution);
    }

    ExecutionResult result = ExecutionResult::Make(
        ExecutionStatus::ValidationFailed, "",
        fmt::format("Validation failed: {}", JoinErrors(outcome.validation.errors)));
    result.metadata["validation"] = outcome.validation.ToJson();
    if (!script.GetRequestId().empty()) {
        result.metadata["request_id"] = script.GetRequestId();
    }
    return result;
}

} // namespace scriptbox
