// config_manager.cpp - YAML configuration implementation
#include "scriptbox/config_manager.h"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace scriptbox {

namespace {

void ApplyYaml(const YAML::Node& yaml, SandboxConfig& config) {
    // Execution settings
    if (yaml["execution"]) {
        auto execution = yaml["execution"];
        if (execution["mode"]) {
            std::string mode = execution["mode"].as<std::string>();
            if (auto parsed = ParseExecutionMode(mode)) {
                config.execution.mode = *parsed;
            } else {
                spdlog::warn("Config: unknown execution.mode '{}', keeping {}", mode,
                             GetExecutionModeName(config.execution.mode));
            }
        }
        if (execution["interpreter"]) config.execution.interpreter = execution["interpreter"].as<std::string>();
        if (execution["interpreter_args"]) config.execution.interpreter_args = execution["interpreter_args"].as<std::vector<std::string>>();
        if (execution["host"]) {
            std::string host = execution["host"].as<std::string>();
            if (auto parsed = ParseHostProfile(host)) {
                config.execution.host = *parsed;
            } else {
                spdlog::warn("Config: unknown execution.host '{}', keeping {}", host,
                             GetHostProfileName(config.execution.host));
            }
        }
        if (execution["document_name"]) config.execution.document_name = execution["document_name"].as<std::string>();
        if (execution["timeout_seconds"]) config.execution.timeout_seconds = execution["timeout_seconds"].as<double>();
        if (execution["working_directory"]) config.execution.working_directory = execution["working_directory"].as<std::string>();
        if (execution["temp_directory"]) config.execution.temp_directory = execution["temp_directory"].as<std::string>();
        if (execution["max_memory_mb"]) config.execution.max_memory_mb = execution["max_memory_mb"].as<size_t>();
        if (execution["max_output_bytes"]) config.execution.max_output_bytes = execution["max_output_bytes"].as<size_t>();
        if (execution["clean_environment"]) config.execution.clean_environment = execution["clean_environment"].as<bool>();
        if (execution["probe_version"]) config.execution.probe_version = execution["probe_version"].as<bool>();
    }

    // Retry settings
    if (yaml["retry"]) {
        auto retry = yaml["retry"];
        if (retry["max_attempts"]) config.retry.max_attempts = retry["max_attempts"].as<int>();
        if (retry["backoff_unit_ms"]) config.retry.backoff_unit_ms = retry["backoff_unit_ms"].as<int>();
        if (retry["transient_signatures"]) config.retry.transient_signatures = retry["transient_signatures"].as<std::vector<std::string>>();
    }

    // Validation policy
    if (yaml["validation"]) {
        auto validation = yaml["validation"];
        if (validation["mode"]) {
            std::string mode = validation["mode"].as<std::string>();
            if (auto parsed = ParsePolicyMode(mode)) {
                config.validation.mode = *parsed;
            } else {
                spdlog::warn("Config: unknown validation.mode '{}', keeping {}", mode,
                             GetPolicyModeName(config.validation.mode));
            }
        }
        if (validation["block_dunder_attributes"]) config.validation.block_dunder_attributes = validation["block_dunder_attributes"].as<bool>();
        if (validation["replace_defaults"]) config.validation.replace_defaults = validation["replace_defaults"].as<bool>();
        if (validation["allowed_modules"]) config.validation.allowed_modules = validation["allowed_modules"].as<std::vector<std::string>>();
        if (validation["blocked_modules"]) config.validation.blocked_modules = validation["blocked_modules"].as<std::vector<std::string>>();
        if (validation["allowed_builtins"]) config.validation.allowed_builtins = validation["allowed_builtins"].as<std::vector<std::string>>();
        if (validation["blocked_operations"]) config.validation.blocked_operations = validation["blocked_operations"].as<std::vector<std::string>>();
        if (validation["in_process_builtins"]) config.validation.in_process_builtins = validation["in_process_builtins"].as<std::vector<std::string>>();
    }

    // Parser settings
    if (yaml["parser"]) {
        auto parser = yaml["parser"];
        if (parser["benign_stderr_prefixes"]) config.parser.benign_stderr_prefixes = parser["benign_stderr_prefixes"].as<std::vector<std::string>>();
    }

    // Concurrency settings
    if (yaml["concurrency"]) {
        auto concurrency = yaml["concurrency"];
        if (concurrency["max_concurrent"]) config.concurrency.max_concurrent = concurrency["max_concurrent"].as<int>();
    }

    // Logging settings
    if (yaml["logging"]) {
        auto logging = yaml["logging"];
        if (logging["level"]) config.logging.level = logging["level"].as<std::string>();
        if (logging["file"]) config.logging.file = logging["file"].as<std::string>();
    }
}

} // anonymous namespace

ConfigManager::ConfigManager() {
    cached_config_ = GetDefaultConfig();
    spdlog::debug("ConfigManager created");
}

bool ConfigManager::Load(const std::string& path) {
    return LoadConfig(path, cached_config_);
}

bool ConfigManager::Save() {
    if (last_loaded_path_.empty()) {
        last_loaded_path_ = FindConfigFile();
    }
    return SaveConfig(cached_config_, last_loaded_path_);
}

bool ConfigManager::LoadConfig(const std::string& path, SandboxConfig& config) {
    try {
        if (!std::filesystem::exists(path)) {
            spdlog::warn("Config file not found: {}, using defaults", path);
            config = GetDefaultConfig();
            return true;
        }

        YAML::Node yaml = YAML::LoadFile(path);
        last_loaded_path_ = path;

        SandboxConfig loaded = GetDefaultConfig();
        ApplyYaml(yaml, loaded);
        config = loaded;

        spdlog::info("Config loaded from: {}", path);
        return true;

    } catch (const YAML::Exception& e) {
        spdlog::error("Failed to parse config file: {}", e.what());
        config = GetDefaultConfig();
        return false;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        config = GetDefaultConfig();
        return false;
    }
}

bool ConfigManager::LoadFromString(const std::string& yaml_text, SandboxConfig& config) {
    try {
        SandboxConfig loaded = GetDefaultConfig();
        ApplyYaml(YAML::Load(yaml_text), loaded);
        config = loaded;
        return true;

    } catch (const YAML::Exception& e) {
        spdlog::error("Failed to parse config: {}", e.what());
        config = GetDefaultConfig();
        return false;
    }
}

bool ConfigManager::SaveConfig(const SandboxConfig& config, const std::string& path) {
    try {
        // Create parent directories if needed
        std::filesystem::path file_path(path);
        if (file_path.has_parent_path()) {
            std::filesystem::create_directories(file_path.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        // Execution settings
        out << YAML::Key << "execution" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "mode" << YAML::Value << GetExecutionModeName(config.execution.mode);
        out << YAML::Key << "interpreter" << YAML::Value << config.execution.interpreter;
        out << YAML::Key << "interpreter_args" << YAML::Value << YAML::Flow << config.execution.interpreter_args;
        out << YAML::Key << "host" << YAML::Value << GetHostProfileName(config.execution.host);
        out << YAML::Key << "document_name" << YAML::Value << config.execution.document_name;
        out << YAML::Key << "timeout_seconds" << YAML::Value << config.execution.timeout_seconds;
        out << YAML::Key << "working_directory" << YAML::Value << config.execution.working_directory;
        out << YAML::Key << "temp_directory" << YAML::Value << config.execution.temp_directory;
        out << YAML::Key << "max_memory_mb" << YAML::Value << config.execution.max_memory_mb;
        out << YAML::Key << "max_output_bytes" << YAML::Value << config.execution.max_output_bytes;
        out << YAML::Key << "clean_environment" << YAML::Value << config.execution.clean_environment;
        out << YAML::Key << "probe_version" << YAML::Value << config.execution.probe_version;
        out << YAML::EndMap;

        // Retry settings
        out << YAML::Key << "retry" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "max_attempts" << YAML::Value << config.retry.max_attempts;
        out << YAML::Key << "backoff_unit_ms" << YAML::Value << config.retry.backoff_unit_ms;
        out << YAML::Key << "transient_signatures" << YAML::Value << config.retry.transient_signatures;
        out << YAML::EndMap;

        // Validation policy
        out << YAML::Key << "validation" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "mode" << YAML::Value << GetPolicyModeName(config.validation.mode);
        out << YAML::Key << "block_dunder_attributes" << YAML::Value << config.validation.block_dunder_attributes;
        out << YAML::Key << "replace_defaults" << YAML::Value << config.validation.replace_defaults;
        out << YAML::Key << "allowed_modules" << YAML::Value << config.validation.allowed_modules;
        out << YAML::Key << "blocked_modules" << YAML::Value << config.validation.blocked_modules;
        out << YAML::Key << "allowed_builtins" << YAML::Value << config.validation.allowed_builtins;
        out << YAML::Key << "blocked_operations" << YAML::Value << config.validation.blocked_operations;
        out << YAML::Key << "in_process_builtins" << YAML::Value << config.validation.in_process_builtins;
        out << YAML::EndMap;

        // Parser settings
        out << YAML::Key << "parser" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "benign_stderr_prefixes" << YAML::Value << config.parser.benign_stderr_prefixes;
        out << YAML::EndMap;

        // Concurrency settings
        out << YAML::Key << "concurrency" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "max_concurrent" << YAML::Value << config.concurrency.max_concurrent;
        out << YAML::EndMap;

        // Logging settings
        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << config.logging.level;
        out << YAML::Key << "file" << YAML::Value << config.logging.file;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(path);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", path);
            return false;
        }
        file << out.c_str();
        file.close();

        spdlog::info("Config saved to: {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

SandboxConfig ConfigManager::GetDefaultConfig() {
    return SandboxConfig{};
}

std::string ConfigManager::FindConfigFile() {
    const char* env_path = std::getenv("SCRIPTBOX_CONFIG");
    const char* home = std::getenv("HOME");

    // Check in order of priority
    std::vector<std::string> paths = {
        env_path ? env_path : "",
        "./scriptbox.yaml",
        home ? std::string(home) + "/.config/scriptbox/scriptbox.yaml" : "",
    };

    for (const auto& path : paths) {
        if (!path.empty() && std::filesystem::exists(path)) {
            return path;
        }
    }

    return "./scriptbox.yaml";  // Default location
}

} // namespace scriptbox
