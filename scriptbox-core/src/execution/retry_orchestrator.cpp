#include "scriptbox/retry_orchestrator.h"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <thread>

namespace scriptbox {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string JoinLines(const std::vector<std::string>& items) {
    std::string joined;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            joined += "\n";
        }
        joined += items[i];
    }
    return joined;
}

} // anonymous namespace

nlohmann::json RetryAttempt::ToJson() const {
    return {
        {"attempt", attempt},
        {"delay_before_ms", delay_before.count()},
        {"status", GetStatusName(status)},
        {"error", error}
    };
}

RetryOrchestrator::RetryOrchestrator(ScriptExecutor& executor, OutputParser parser, RetryOptions options)
    : executor_(executor)
    , parser_(std::move(parser))
    , options_(std::move(options))
    , sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); })
{
}

std::chrono::milliseconds RetryOrchestrator::BackoffDelay(int failed_attempt, std::chrono::milliseconds unit) {
    int exponent = std::max(0, failed_attempt - 1);
    exponent = std::min(exponent, 30);
    return unit * (1LL << exponent);
}

bool RetryOrchestrator::IsTransient(const ExecutionResult& result) const {
    // Timeouts, spawn failures and validation failures are terminal
    if (result.status != ExecutionStatus::ExecutionFailed) {
        return false;
    }
    std::string error = ToLower(result.error);
    for (const auto& signature : options_.transient_signatures) {
        if (!signature.empty() && error.find(ToLower(signature)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

ExecutionResult RetryOrchestrator::Interpret(const ExecutionResult& raw) const {
    if (raw.status != ExecutionStatus::Success && raw.status != ExecutionStatus::ExecutionFailed) {
        return raw;
    }

    ExecutionResult result = raw;
    int exit_code = raw.exit_code.value_or(raw.status == ExecutionStatus::Success ? 0 : 1);
    std::string stderr_text;
    if (raw.metadata.contains("stderr") && raw.metadata["stderr"].is_string()) {
        stderr_text = raw.metadata["stderr"].get<std::string>();
    }

    ParsedOutcome parsed = parser_.Parse(raw.output, stderr_text, exit_code);
    result.created_entities = parsed.created_entities;
    result.metadata["warnings"] = parsed.warnings;
    result.metadata["recompute_success"] = parsed.completion_signal_seen;

    if (parsed.success) {
        result.SetStatus(ExecutionStatus::Success);
        result.error.clear();
    } else {
        result.SetStatus(ExecutionStatus::ExecutionFailed);
        result.error = JoinLines(parsed.errors);
    }
    return result;
}

ExecutionResult RetryOrchestrator::Run(const Script& script,
                                       int max_attempts,
                                       std::chrono::milliseconds timeout,
                                       const std::optional<std::string>& working_dir) {
    if (max_attempts < 1) {
        spdlog::warn("RetryOrchestrator: max_attempts {} clamped to 1", max_attempts);
        max_attempts = 1;
    }

    ExecutionRequest request;
    request.script = script;
    request.working_dir = working_dir;
    request.timeout = timeout;

    ExecutionResult candidate = ExecutionResult::Make(ExecutionStatus::UnknownError);
    std::vector<RetryAttempt> history;
    std::chrono::milliseconds total_time{0};
    std::chrono::milliseconds delay{0};

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (delay.count() > 0) {
            sleeper_(delay);
        }

        spdlog::info("RetryOrchestrator: attempt {}/{} ({})", attempt, max_attempts,
                     executor_.GetModeName());
        try {
            candidate = Interpret(executor_.Execute(request));
        } catch (const std::exception& e) {
            candidate = ExecutionResult::Make(ExecutionStatus::UnknownError, "",
                                              fmt::format("Execution error: {}", e.what()));
            spdlog::error("RetryOrchestrator: {}", candidate.error);
        }
        total_time += candidate.execution_time;

        RetryAttempt record;
        record.attempt = attempt;
        record.delay_before = delay;
        record.status = candidate.status;
        record.error = candidate.error;
        history.push_back(record);

        if (candidate.success) {
            break;
        }

        if (!IsTransient(candidate) || attempt == max_attempts) {
            if (IsTransient(candidate)) {
                spdlog::warn("RetryOrchestrator: transient failure persisted after {} attempts", attempt);
            }
            break;
        }

        delay = BackoffDelay(attempt, options_.backoff_unit);
        spdlog::warn("RetryOrchestrator: transient failure on attempt {}, retrying in {} ms: {}",
                     attempt, delay.count(), candidate.error);
    }

    nlohmann::json attempts = nlohmann::json::array();
    for (const auto& record : history) {
        attempts.push_back(record.ToJson());
    }

    candidate.execution_time = total_time;
    candidate.metadata["retries"] = static_cast<int>(history.size());
    candidate.metadata["attempts"] = attempts;
    if (!candidate.success) {
        candidate.metadata["last_error"] = candidate.error;
        spdlog::info("RetryOrchestrator: failed with status {} after {} attempt(s)",
                     GetStatusName(candidate.status), history.size());
    } else {
        spdlog::info("RetryOrchestrator: succeeded on attempt {} ({} entities)",
                     history.size(), candidate.created_entities.size());
    }
    return candidate;
}

} // namespace scriptbox
