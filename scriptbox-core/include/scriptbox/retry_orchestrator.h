// retry_orchestrator.h - Bounded retry loop around an executor
#pragma once

#include "api_export.h"
#include "executor.h"
#include "output_parser.h"
#include "result.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace scriptbox {

struct SCRIPTBOX_API RetryOptions {
    int max_attempts = 3;
    std::chrono::milliseconds backoff_unit{1000};
    std::vector<std::string> transient_signatures{"recompute failed"};
};

struct SCRIPTBOX_API RetryAttempt {
    int attempt = 0;
    std::chrono::milliseconds delay_before{0};
    ExecutionStatus status = ExecutionStatus::UnknownError;
    std::string error;

    nlohmann::json ToJson() const;
};

/**
 * RetryOrchestrator - Executor + parser + transient-failure retry
 *
 * Attempting -> Succeeded
 * Attempting -> Retrying -> Attempting   (transient ExecutionFailed, attempts left)
 * Attempting -> ExhaustedFailure         (anything else)
 *
 * Before attempt k (k > 1) it sleeps 2^(k-2) backoff units, i.e. 1, 2, 4...
 * units after the first, second, third failure. The final result carries
 * metadata.retries (attempts made), metadata.attempts (history) and, on
 * failure, metadata.last_error.
 */
class SCRIPTBOX_API RetryOrchestrator {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit RetryOrchestrator(ScriptExecutor& executor,
                               OutputParser parser = OutputParser(),
                               RetryOptions options = RetryOptions());

    ExecutionResult Run(const Script& script,
                        int max_attempts,
                        std::chrono::milliseconds timeout,
                        const std::optional<std::string>& working_dir = std::nullopt);

    // Combines a provisional executor result with the parsed marker output
    ExecutionResult Interpret(const ExecutionResult& raw) const;

    bool IsTransient(const ExecutionResult& result) const;

    // Delay after `failed_attempt` failed: 2^(failed_attempt-1) * unit
    static std::chrono::milliseconds BackoffDelay(int failed_attempt, std::chrono::milliseconds unit);

    void SetSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    const RetryOptions& GetOptions() const { return options_; }
    const OutputParser& GetParser() const { return parser_; }

private:
    ScriptExecutor& executor_;
    OutputParser parser_;
    RetryOptions options_;
    Sleeper sleeper_;
};

} // namespace scriptbox
