// result.cpp - Result model serialization
#include "scriptbox/result.h"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace scriptbox {

Script::Script(std::string text, nlohmann::json context, std::string request_id)
    : text_(std::move(text))
    , context_(context.is_null() ? nlohmann::json::object() : std::move(context))
    , request_id_(std::move(request_id))
{
}

const char* GetStatusName(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Success: return "success";
        case ExecutionStatus::ValidationFailed: return "validation_failed";
        case ExecutionStatus::ExecutionFailed: return "execution_failed";
        case ExecutionStatus::Timeout: return "timeout";
        case ExecutionStatus::UnknownError: return "unknown_error";
        default: return "unknown_error";
    }
}

std::optional<ExecutionStatus> ParseStatusName(const std::string& name) {
    if (name == "success") return ExecutionStatus::Success;
    if (name == "validation_failed") return ExecutionStatus::ValidationFailed;
    if (name == "execution_failed") return ExecutionStatus::ExecutionFailed;
    if (name == "timeout") return ExecutionStatus::Timeout;
    if (name == "unknown_error") return ExecutionStatus::UnknownError;
    return std::nullopt;
}

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    std::time_t t = std::chrono::system_clock::to_time_t(secs);

    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    return fmt::format("{}.{:03d}Z", oss.str(), static_cast<int>(millis));
}

namespace {

std::chrono::system_clock::time_point ParseTimestamp(const std::string& text) {
    std::tm utc{};
    std::istringstream iss(text);
    iss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::chrono::system_clock::now();
    }

    auto tp = std::chrono::system_clock::from_time_t(timegm(&utc));

    // Optional ".mmm" fraction
    if (iss.peek() == '.') {
        iss.get();
        std::string digits;
        while (std::isdigit(iss.peek())) {
            digits.push_back(static_cast<char>(iss.get()));
        }
        digits.resize(3, '0');
        tp += std::chrono::milliseconds(std::stoi(digits));
    }
    return tp;
}

// Upper bound for a deserialized duration, keeps the millisecond count in range
constexpr double kMaxExecutionSeconds = 1.0e9;

// Non-string elements are skipped
std::vector<std::string> StringList(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
        return out;
    }
    for (const auto& item : *it) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

std::string StringField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::chrono::milliseconds SecondsField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return std::chrono::milliseconds(0);
    }
    double seconds = it->get<double>();
    if (!std::isfinite(seconds) || seconds <= 0.0) {
        return std::chrono::milliseconds(0);
    }
    seconds = std::min(seconds, kMaxExecutionSeconds);
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0 + 0.5));
}

} // anonymous namespace

// ========== ValidationResult ==========

ValidationResult ValidationResult::SyntaxError(const std::string& message, int line) {
    ValidationResult result;
    result.errors.push_back(fmt::format("Syntax error: {} at line {}", message, line));
    result.Finalize();
    return result;
}

nlohmann::json ValidationResult::ToJson() const {
    return {
        {"valid", valid},
        {"errors", errors},
        {"warnings", warnings},
        {"allowed_symbols", allowed_symbols},
        {"blocked_symbols", blocked_symbols}
    };
}

ValidationResult ValidationResult::FromJson(const nlohmann::json& j) {
    ValidationResult result;
    if (!j.is_object()) {
        return result;
    }
    result.errors = StringList(j, "errors");
    result.warnings = StringList(j, "warnings");
    result.allowed_symbols = StringList(j, "allowed_symbols");
    result.blocked_symbols = StringList(j, "blocked_symbols");
    result.Finalize();
    return result;
}

bool ValidationResult::operator==(const ValidationResult& other) const {
    return valid == other.valid &&
           errors == other.errors &&
           warnings == other.warnings &&
           allowed_symbols == other.allowed_symbols &&
           blocked_symbols == other.blocked_symbols;
}

// ========== ExecutionResult ==========

ExecutionResult ExecutionResult::Make(ExecutionStatus status, std::string output, std::string error) {
    ExecutionResult result;
    result.SetStatus(status);
    result.output = std::move(output);
    result.error = std::move(error);
    return result;
}

nlohmann::json ExecutionResult::ToJson() const {
    nlohmann::json j = {
        {"success", success},
        {"status", GetStatusName(status)},
        {"output", output},
        {"error", error},
        {"execution_time", static_cast<double>(execution_time.count()) / 1000.0},
        {"exit_code", nullptr},
        {"created_entities", created_entities},
        {"metadata", metadata},
        {"timestamp", FormatTimestamp(timestamp)}
    };
    if (exit_code) {
        j["exit_code"] = *exit_code;
    }
    return j;
}

ExecutionResult ExecutionResult::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Make(ExecutionStatus::UnknownError);
    }

    auto status = ParseStatusName(StringField(j, "status"));
    ExecutionResult result = Make(status.value_or(ExecutionStatus::UnknownError),
                                  StringField(j, "output"),
                                  StringField(j, "error"));

    result.execution_time = SecondsField(j, "execution_time");

    auto exit_code = j.find("exit_code");
    if (exit_code != j.end() && exit_code->is_number_integer()) {
        int64_t code = exit_code->get<int64_t>();
        if (code >= std::numeric_limits<int>::min() && code <= std::numeric_limits<int>::max()) {
            result.exit_code = static_cast<int>(code);
        }
    }

    result.created_entities = StringList(j, "created_entities");

    auto metadata = j.find("metadata");
    if (metadata != j.end() && metadata->is_object()) {
        result.metadata = *metadata;
    }

    auto timestamp = j.find("timestamp");
    if (timestamp != j.end() && timestamp->is_string()) {
        result.timestamp = ParseTimestamp(timestamp->get<std::string>());
    }

    return result;
}

} // namespace scriptbox
