// executor.h - Execution strategy interface
#pragma once

#include "api_export.h"
#include "result.h"
#include <chrono>
#include <optional>
#include <string>

namespace scriptbox {

struct SCRIPTBOX_API ExecutionRequest {
    Script script;
    std::optional<std::string> working_dir;
    std::chrono::milliseconds timeout{30000};
};

/**
 * ScriptExecutor - Runs one already-validated script once
 *
 * Implementations never throw out of Execute(). The returned status is
 * provisional (Success, ExecutionFailed, Timeout or UnknownError); the
 * RetryOrchestrator combines it with the parsed marker output.
 */
class SCRIPTBOX_API ScriptExecutor {
public:
    virtual ~ScriptExecutor() = default;

    virtual ExecutionResult Execute(const ExecutionRequest& request) = 0;

    // "subprocess" or "in_process"
    virtual const char* GetModeName() const = 0;
};

} // namespace scriptbox
