// main.cpp - Entry point for scriptbox-run
// Validates and executes one script, printing the JSON result on stdout

#include <scriptbox/scriptbox.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <script.py | ->\n"
              << "\nOptions:\n"
              << "  --config=PATH        Path to config file (default: $SCRIPTBOX_CONFIG or ./scriptbox.yaml)\n"
              << "  --context=JSON       JSON object exposed to the script as _context\n"
              << "  --request-id=ID      Request id copied into the result metadata\n"
              << "  --timeout=SECONDS    Per-attempt timeout (overrides config)\n"
              << "  --max-attempts=N     Maximum attempts for transient failures (overrides config)\n"
              << "  --validate-only      Print the validation result without executing\n"
              << "  --in-process         Run inside the embedded interpreter (reduced isolation)\n"
              << "  --log-level=LEVEL    trace, debug, info, warn, error, critical, off\n"
              << "  --help               Show this help message\n"
              << "\nExit codes: 0 success, 1 failure, 2 usage error\n"
              << std::endl;
}

struct RunnerOptions {
    std::string config_path;
    std::string context_json;
    std::string request_id;
    std::string script_path;
    std::string log_level;
    double timeout_seconds = 0.0;
    int max_attempts = 0;
    bool validate_only = false;
    bool in_process = false;
    bool show_help = false;
};

bool ParseArgs(int argc, char** argv, RunnerOptions& options, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        if (std::strncmp(argv[i], "--config=", 9) == 0) {
            options.config_path = argv[i] + 9;
        } else if (std::strncmp(argv[i], "--context=", 10) == 0) {
            options.context_json = argv[i] + 10;
        } else if (std::strncmp(argv[i], "--request-id=", 13) == 0) {
            options.request_id = argv[i] + 13;
        } else if (std::strncmp(argv[i], "--timeout=", 10) == 0) {
            char* end = nullptr;
            options.timeout_seconds = std::strtod(argv[i] + 10, &end);
            if (end == argv[i] + 10 || *end != '\0' || options.timeout_seconds <= 0.0) {
                error = std::string("Invalid timeout: ") + (argv[i] + 10);
                return false;
            }
        } else if (std::strncmp(argv[i], "--max-attempts=", 15) == 0) {
            char* end = nullptr;
            long attempts = std::strtol(argv[i] + 15, &end, 10);
            if (end == argv[i] + 15 || *end != '\0' || attempts < 1) {
                error = std::string("Invalid max attempts: ") + (argv[i] + 15);
                return false;
            }
            options.max_attempts = static_cast<int>(attempts);
        } else if (std::strncmp(argv[i], "--log-level=", 12) == 0) {
            options.log_level = argv[i] + 12;
        } else if (std::strcmp(argv[i], "--validate-only") == 0) {
            options.validate_only = true;
        } else if (std::strcmp(argv[i], "--in-process") == 0) {
            options.in_process = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            options.show_help = true;
            return true;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            error = std::string("Unknown option: ") + argv[i];
            return false;
        } else if (options.script_path.empty()) {
            options.script_path = argv[i];
        } else {
            error = std::string("Unexpected argument: ") + argv[i];
            return false;
        }
    }

    if (options.script_path.empty()) {
        error = "No script given";
        return false;
    }
    return true;
}

bool ReadScript(const std::string& path, std::string& text) {
    if (path == "-") {
        text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    text = buffer.str();
    return true;
}

} // anonymous namespace

int main(int argc, char** argv) {
    RunnerOptions options;
    std::string error;
    if (!ParseArgs(argc, argv, options, error)) {
        std::cerr << "Error: " << error << "\n\n";
        PrintUsage(argv[0]);
        return kExitUsage;
    }
    if (options.show_help) {
        PrintUsage(argv[0]);
        return kExitSuccess;
    }

    // stdout carries only the JSON result; route config loading logs to stderr
    scriptbox::InitializeLogging(options.log_level.empty() ? "info" : options.log_level);

    // Load configuration, then apply command-line overrides
    scriptbox::ConfigManager config_manager;
    std::string config_path = options.config_path.empty()
        ? scriptbox::ConfigManager::FindConfigFile()
        : options.config_path;
    scriptbox::SandboxConfig config;
    if (!config_manager.LoadConfig(config_path, config)) {
        std::cerr << "Error: invalid config file " << config_path << std::endl;
        return kExitUsage;
    }

    if (!options.log_level.empty()) {
        config.logging.level = options.log_level;
    }
    scriptbox::InitializeLogging(config.logging.level, config.logging.file);

    if (options.timeout_seconds > 0.0) {
        config.execution.timeout_seconds = options.timeout_seconds;
    }
    if (options.max_attempts > 0) {
        config.retry.max_attempts = options.max_attempts;
    }
    if (options.in_process) {
        config.execution.mode = scriptbox::ExecutionMode::InProcess;
    }

    nlohmann::json context = nlohmann::json::object();
    if (!options.context_json.empty()) {
        try {
            context = nlohmann::json::parse(options.context_json);
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "Error: invalid --context JSON: " << e.what() << std::endl;
            return kExitUsage;
        }
        if (!context.is_object()) {
            std::cerr << "Error: --context must be a JSON object" << std::endl;
            return kExitUsage;
        }
    }

    std::string text;
    if (!ReadScript(options.script_path, text)) {
        std::cerr << "Error: cannot read script " << options.script_path << std::endl;
        return kExitUsage;
    }

    if (!scriptbox::Initialize()) {
        spdlog::critical("scriptbox-run: initialization failed");
        return kExitFailure;
    }

    scriptbox::Script script(text, context, options.request_id);
    int exit_code = kExitFailure;
    {
        scriptbox::ScriptSandbox sandbox(config);

        if (options.validate_only) {
            scriptbox::ValidationResult validation = sandbox.Validate(script);
            std::cout << validation.ToJson().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
            exit_code = validation.valid ? kExitSuccess : kExitFailure;
        } else {
            scriptbox::ExecutionResult result = sandbox.Execute(script);
            std::cout << result.ToJson().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
            exit_code = result.success ? kExitSuccess : kExitFailure;
        }
    }

    scriptbox::Shutdown();
    return exit_code;
}
