// result.h - Value types for validation and execution outcomes
#pragma once

#include "api_export.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace scriptbox {

// Script submitted by the upstream generator. Immutable once constructed.
struct SCRIPTBOX_API Script {
    Script() = default;
    explicit Script(std::string text,
                    nlohmann::json context = nlohmann::json::object(),
                    std::string request_id = "");

    const std::string& GetText() const { return text_; }
    const nlohmann::json& GetContext() const { return context_; }
    const std::string& GetRequestId() const { return request_id_; }
    bool HasContext() const { return !context_.empty(); }

private:
    std::string text_;
    nlohmann::json context_ = nlohmann::json::object();
    std::string request_id_;
};

enum class ExecutionStatus {
    Success,
    ValidationFailed,
    ExecutionFailed,
    Timeout,
    UnknownError
};

// Wire name ("success", "validation_failed", ...)
SCRIPTBOX_API const char* GetStatusName(ExecutionStatus status);
SCRIPTBOX_API std::optional<ExecutionStatus> ParseStatusName(const std::string& name);

struct SCRIPTBOX_API ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<std::string> allowed_symbols;
    std::vector<std::string> blocked_symbols;

    // Recompute `valid` from `errors`; called once the walk is done
    void Finalize() { valid = errors.empty(); }

    static ValidationResult SyntaxError(const std::string& message, int line);

    nlohmann::json ToJson() const;
    static ValidationResult FromJson(const nlohmann::json& j);

    bool operator==(const ValidationResult& other) const;
    bool operator!=(const ValidationResult& other) const { return !(*this == other); }
};

struct SCRIPTBOX_API ExecutionResult {
    bool success = false;
    ExecutionStatus status = ExecutionStatus::UnknownError;
    std::string output;
    std::string error;
    std::chrono::milliseconds execution_time{0};
    std::optional<int> exit_code;
    std::vector<std::string> created_entities;
    nlohmann::json metadata = nlohmann::json::object();
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    // Keeps success == (status == Success)
    static ExecutionResult Make(ExecutionStatus status,
                                std::string output = "",
                                std::string error = "");

    void SetStatus(ExecutionStatus new_status) {
        status = new_status;
        success = (new_status == ExecutionStatus::Success);
    }

    nlohmann::json ToJson() const;
    static ExecutionResult FromJson(const nlohmann::json& j);
};

// ISO-8601 UTC with millisecond precision, e.g. 2026-10-19T12:00:00.123Z
SCRIPTBOX_API std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

} // namespace scriptbox
