#include <catch2/catch_test_macros.hpp>
#include <scriptbox/config_manager.h>
#include <filesystem>
#include <fstream>
#include <stdlib.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace scriptbox;

namespace {

// Restores SCRIPTBOX_CONFIG on scope exit
class ScopedConfigEnv {
public:
    explicit ScopedConfigEnv(const std::string& value) {
        const char* previous = std::getenv("SCRIPTBOX_CONFIG");
        if (previous) {
            had_previous_ = true;
            previous_ = previous;
        }
        ::setenv("SCRIPTBOX_CONFIG", value.c_str(), 1);
    }
    ~ScopedConfigEnv() {
        if (had_previous_) {
            ::setenv("SCRIPTBOX_CONFIG", previous_.c_str(), 1);
        } else {
            ::unsetenv("SCRIPTBOX_CONFIG");
        }
    }

private:
    bool had_previous_ = false;
    std::string previous_;
};

fs::path ScratchPath(const std::string& name) {
    return fs::temp_directory_path() / ("scriptbox_config_test_" + std::to_string(::getpid())) / name;
}

} // anonymous namespace

// ========== Default Tests ==========

TEST_CASE("SandboxConfig - Defaults", "[config]") {
    auto config = ConfigManager::GetDefaultConfig();

    REQUIRE(config.execution.mode == ExecutionMode::Subprocess);
    REQUIRE(config.execution.interpreter == "python3");
    REQUIRE(config.execution.host == HostProfile::Generic);
    REQUIRE(config.execution.timeout_seconds == 30.0);
    REQUIRE(config.retry.max_attempts == 3);
    REQUIRE(config.retry.backoff_unit_ms == 1000);
    REQUIRE(config.validation.mode == PolicyMode::Strict);
    REQUIRE(config.concurrency.max_concurrent == 4);
    REQUIRE(config.logging.level == "info");

    REQUIRE(config.GetTimeout() == std::chrono::seconds(30));
    REQUIRE_FALSE(config.GetWorkingDirectory().has_value());
}

TEST_CASE("SandboxConfig - Derived options", "[config]") {
    SandboxConfig config;
    config.execution.interpreter = "freecadcmd";
    config.execution.host = HostProfile::FreeCad;
    config.execution.max_memory_mb = 512;
    config.execution.timeout_seconds = 2.5;
    config.execution.working_directory = "/srv/cad";
    config.retry.backoff_unit_ms = 250;

    auto process = config.BuildProcessOptions();
    REQUIRE(process.interpreter == "freecadcmd");
    REQUIRE(process.host == HostProfile::FreeCad);
    REQUIRE(process.max_memory_mb == 512);

    auto retry = config.BuildRetryOptions();
    REQUIRE(retry.backoff_unit == std::chrono::milliseconds(250));
    REQUIRE(retry.transient_signatures == std::vector<std::string>{"recompute failed"});

    REQUIRE(config.GetTimeout() == std::chrono::milliseconds(2500));
    REQUIRE(config.GetWorkingDirectory() == std::string("/srv/cad"));

    SECTION("Non-positive timeout falls back to 30 seconds") {
        config.execution.timeout_seconds = 0.0;
        REQUIRE(config.GetTimeout() == std::chrono::seconds(30));
    }
}

// ========== Policy Tests ==========

TEST_CASE("SandboxConfig - Policy construction", "[config][policy]") {
    SandboxConfig config;

    SECTION("Lists extend the defaults") {
        config.validation.allowed_modules = {"numpy"};
        config.validation.blocked_operations = {"print"};
        config.validation.in_process_builtins = {"reversed"};

        auto policy = config.BuildPolicy();
        REQUIRE(policy.ClassifyModule("numpy") == SymbolDecision::Allowed);
        REQUIRE(policy.ClassifyModule("os") == SymbolDecision::Blocked);
        REQUIRE(policy.ClassifyOperation("print") == SymbolDecision::Blocked);

        const auto& builtins = policy.GetInProcessBuiltins();
        REQUIRE(builtins.size() == SymbolPolicy::DefaultInProcessBuiltins().size() + 1);
        REQUIRE(builtins.back() == "reversed");
    }

    SECTION("Block wins when a name is on both lists") {
        config.validation.allowed_modules = {"socket"};
        config.validation.blocked_modules = {"socket"};
        REQUIRE(config.BuildPolicy().ClassifyModule("socket") == SymbolDecision::Blocked);
    }

    SECTION("Replacing the defaults") {
        config.validation.replace_defaults = true;
        config.validation.allowed_modules = {"math"};

        auto policy = config.BuildPolicy();
        REQUIRE(policy.ClassifyModule("math") == SymbolDecision::Allowed);
        REQUIRE(policy.ClassifyModule("os") == SymbolDecision::Unknown);
        REQUIRE(policy.GetInProcessBuiltins().empty());
    }

    SECTION("Mode and dunder switch carry over") {
        config.validation.mode = PolicyMode::Permissive;
        config.validation.block_dunder_attributes = false;

        auto policy = config.BuildPolicy();
        REQUIRE(policy.GetMode() == PolicyMode::Permissive);
        REQUIRE_FALSE(policy.BlocksDunderAttributes());
    }
}

// ========== YAML Tests ==========

TEST_CASE("ConfigManager - Load from string", "[config][yaml]") {
    ConfigManager manager;
    SandboxConfig config;

    SECTION("Overrides are applied over defaults") {
        bool ok = manager.LoadFromString(
            "execution:\n"
            "  mode: in_process\n"
            "  interpreter: /opt/FreeCAD.AppImage\n"
            "  host: freecad\n"
            "  timeout_seconds: 12.5\n"
            "retry:\n"
            "  max_attempts: 5\n"
            "validation:\n"
            "  mode: permissive\n"
            "  allowed_modules: [numpy, scipy]\n"
            "concurrency:\n"
            "  max_concurrent: 8\n", config);

        REQUIRE(ok);
        REQUIRE(config.execution.mode == ExecutionMode::InProcess);
        REQUIRE(config.execution.interpreter == "/opt/FreeCAD.AppImage");
        REQUIRE(config.execution.host == HostProfile::FreeCad);
        REQUIRE(config.execution.timeout_seconds == 12.5);
        REQUIRE(config.retry.max_attempts == 5);
        REQUIRE(config.retry.backoff_unit_ms == 1000);
        REQUIRE(config.validation.mode == PolicyMode::Permissive);
        REQUIRE(config.validation.allowed_modules == std::vector<std::string>{"numpy", "scipy"});
        REQUIRE(config.concurrency.max_concurrent == 8);
    }

    SECTION("Unknown enum values keep the safe default") {
        REQUIRE(manager.LoadFromString("execution:\n  mode: thread\nvalidation:\n  mode: lax\n", config));
        REQUIRE(config.execution.mode == ExecutionMode::Subprocess);
        REQUIRE(config.validation.mode == PolicyMode::Strict);
    }

    SECTION("Malformed YAML yields defaults and false") {
        config.retry.max_attempts = 9;
        REQUIRE_FALSE(manager.LoadFromString("execution: [unclosed\n", config));
        REQUIRE(config.retry.max_attempts == 3);
    }

    SECTION("Wrong value type is rejected") {
        REQUIRE_FALSE(manager.LoadFromString("retry:\n  max_attempts: many\n", config));
        REQUIRE(config.retry.max_attempts == 3);
    }

    SECTION("Empty document is all defaults") {
        REQUIRE(manager.LoadFromString("", config));
        REQUIRE(config.execution.interpreter == "python3");
    }
}

TEST_CASE("ConfigManager - Files", "[config][yaml]") {
    ConfigManager manager;
    fs::path path = ScratchPath("nested/scriptbox.yaml");
    std::error_code ec;
    fs::remove_all(path.parent_path().parent_path(), ec);

    SECTION("Missing file yields defaults and true") {
        SandboxConfig config;
        config.retry.max_attempts = 7;
        REQUIRE(manager.LoadConfig(path.string(), config));
        REQUIRE(config.retry.max_attempts == 3);
    }

    SECTION("Save then load keeps values") {
        SandboxConfig config;
        config.execution.interpreter = "freecadcmd";
        config.execution.interpreter_args = {"-c"};
        config.execution.host = HostProfile::FreeCad;
        config.execution.timeout_seconds = 45.0;
        config.execution.probe_version = true;
        config.retry.transient_signatures = {"recompute failed", "document busy"};
        config.validation.blocked_modules = {"numpy"};
        config.logging.level = "debug";

        REQUIRE(manager.SaveConfig(config, path.string()));
        REQUIRE(fs::exists(path));

        SandboxConfig loaded;
        REQUIRE(manager.LoadConfig(path.string(), loaded));
        REQUIRE(loaded.execution.interpreter == "freecadcmd");
        REQUIRE(loaded.execution.interpreter_args == std::vector<std::string>{"-c"});
        REQUIRE(loaded.execution.host == HostProfile::FreeCad);
        REQUIRE(loaded.execution.timeout_seconds == 45.0);
        REQUIRE(loaded.execution.probe_version);
        REQUIRE(loaded.retry.transient_signatures == config.retry.transient_signatures);
        REQUIRE(loaded.validation.blocked_modules == std::vector<std::string>{"numpy"});
        REQUIRE(loaded.logging.level == "debug");
    }

    SECTION("Cached config is saved to the loaded path") {
        REQUIRE(manager.SaveConfig(SandboxConfig{}, path.string()));
        REQUIRE(manager.Load(path.string()));

        SandboxConfig changed = manager.GetConfig();
        changed.concurrency.max_concurrent = 2;
        manager.SetConfig(changed);
        REQUIRE(manager.Save());

        ConfigManager reader;
        REQUIRE(reader.Load(path.string()));
        REQUIRE(reader.GetConfig().concurrency.max_concurrent == 2);
    }

    SECTION("Corrupt file yields defaults and false") {
        fs::create_directories(path.parent_path());
        std::ofstream(path) << "retry: {max_attempts: [\n";

        SandboxConfig config;
        REQUIRE_FALSE(manager.LoadConfig(path.string(), config));
        REQUIRE(config.retry.max_attempts == 3);
    }

    fs::remove_all(path.parent_path().parent_path(), ec);
}

TEST_CASE("ConfigManager - Config file discovery", "[config]") {
    fs::path path = ScratchPath("env.yaml");
    fs::create_directories(path.parent_path());
    std::ofstream(path) << "retry:\n  max_attempts: 2\n";

    {
        ScopedConfigEnv env(path.string());
        REQUIRE(ConfigManager::FindConfigFile() == path.string());
    }

    SECTION("Missing env file falls through") {
        ScopedConfigEnv env((path.parent_path() / "missing.yaml").string());
        REQUIRE(ConfigManager::FindConfigFile() != (path.parent_path() / "missing.yaml").string());
    }

    std::error_code ec;
    fs::remove_all(path.parent_path(), ec);
}
