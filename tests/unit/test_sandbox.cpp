#include <catch2/catch_test_macros.hpp>
#include <scriptbox/sandbox.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace scriptbox;

namespace {

// Returns a successful marker stream and records peak concurrency
class CountingExecutor : public ScriptExecutor {
public:
    CountingExecutor(std::atomic<int>& active, std::atomic<int>& peak)
        : active_(active), peak_(peak) {}

    ExecutionResult Execute(const ExecutionRequest& request) override {
        int now = ++active_;
        int previous = peak_.load();
        while (now > previous && !peak_.compare_exchange_weak(previous, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        --active_;

        ++calls;
        last_timeout_ms = request.timeout.count();
        auto result = ExecutionResult::Make(ExecutionStatus::Success,
                                            "ENTITY_CREATED: Part\nRECOMPUTE_SUCCESS\n");
        result.exit_code = 0;
        return result;
    }

    const char* GetModeName() const override { return "counting"; }

    std::atomic<int> calls{0};
    std::atomic<long long> last_timeout_ms{0};

private:
    std::atomic<int>& active_;
    std::atomic<int>& peak_;
};

} // anonymous namespace

// ========== Validation Gate Tests ==========

TEST_CASE("ScriptSandbox - Rejected scripts never execute", "[sandbox][security]") {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    auto executor = std::make_unique<CountingExecutor>(active, peak);
    CountingExecutor* counting = executor.get();
    ScriptSandbox sandbox(SandboxConfig(), std::move(executor));

    Script script("import os\nos.system('rm -rf /')\n", nullptr, "req-9");

    SECTION("Run reports validation only") {
        auto outcome = sandbox.Run(script);
        REQUIRE_FALSE(outcome.validation.valid);
        REQUIRE_FALSE(outcome.execution.has_value());
    }

    SECTION("Execute folds the failure into a result") {
        auto result = sandbox.Execute(script);
        REQUIRE(result.status == ExecutionStatus::ValidationFailed);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error.rfind("Validation failed: Blocked module import: os", 0) == 0);
        REQUIRE(result.metadata["validation"]["valid"] == false);
        REQUIRE(result.metadata["request_id"] == "req-9");
    }

    REQUIRE(counting->calls.load() == 0);
}

TEST_CASE("ScriptSandbox - Accepted scripts run through the orchestrator", "[sandbox]") {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    auto executor = std::make_unique<CountingExecutor>(active, peak);
    CountingExecutor* counting = executor.get();

    SandboxConfig config;
    config.execution.timeout_seconds = 7.0;
    ScriptSandbox sandbox(config, std::move(executor));

    auto outcome = sandbox.Run(Script("print('hello')\n", nullptr, "req-1"));
    REQUIRE(outcome.validation.valid);
    REQUIRE(outcome.execution.has_value());

    const auto& result = *outcome.execution;
    REQUIRE(result.success);
    REQUIRE(result.created_entities == std::vector<std::string>{"Part"});
    REQUIRE(result.metadata["request_id"] == "req-1");
    REQUIRE(result.metadata["retries"] == 1);
    REQUIRE(result.metadata.contains("queue_wait_ms"));
    REQUIRE(counting->calls.load() == 1);
    REQUIRE(counting->last_timeout_ms.load() == 7000);
    REQUIRE(std::string(sandbox.GetExecutor().GetModeName()) == "counting");
}

TEST_CASE("ScriptSandbox - Validation warnings are carried", "[sandbox]") {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    SandboxConfig config;
    config.validation.mode = PolicyMode::Permissive;
    ScriptSandbox sandbox(config, std::make_unique<CountingExecutor>(active, peak));

    auto result = sandbox.Execute(Script("import numpy\n"));
    REQUIRE(result.success);
    REQUIRE(result.metadata["validation_warnings"][0] == "Unusual module import: numpy");
}

// ========== Concurrency Tests ==========

TEST_CASE("ScriptSandbox - Shared slots cap concurrent runs", "[sandbox][concurrency]") {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    auto slots = std::make_shared<ExecutionSlots>(2);

    ScriptSandbox first(SandboxConfig(), std::make_unique<CountingExecutor>(active, peak), slots);
    ScriptSandbox second(SandboxConfig(), std::make_unique<CountingExecutor>(active, peak), slots);
    REQUIRE(first.GetSlots() == second.GetSlots());

    std::vector<std::thread> workers;
    std::atomic<int> successes{0};
    for (int i = 0; i < 6; ++i) {
        ScriptSandbox& sandbox = (i % 2 == 0) ? first : second;
        workers.emplace_back([&sandbox, &successes] {
            if (sandbox.Execute(Script("x = 1\n")).success) {
                ++successes;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    REQUIRE(successes.load() == 6);
    REQUIRE(peak.load() <= 2);
    REQUIRE(slots->GetInUse() == 0);
}

TEST_CASE("ScriptSandbox - Own slots follow the config", "[sandbox]") {
    SandboxConfig config;
    config.concurrency.max_concurrent = 3;
    ScriptSandbox sandbox(config);
    REQUIRE(sandbox.GetSlots()->GetCapacity() == 3);
    REQUIRE(std::string(sandbox.GetExecutor().GetModeName()) == "subprocess");
}

// ========== End-to-End Tests ==========

TEST_CASE("ScriptSandbox - End to end with python3", "[sandbox][process]") {
    ScriptSandbox sandbox;

    SECTION("Entities reported by the script") {
        auto result = sandbox.Execute(Script(
            "for name in _context['names']:\n"
            "    print('ENTITY_CREATED: ' + name)\n",
            {{"names", {"Box001", "Cylinder001"}}}));

        REQUIRE(result.success);
        REQUIRE(result.status == ExecutionStatus::Success);
        REQUIRE(result.created_entities == std::vector<std::string>{"Box001", "Cylinder001"});
        REQUIRE(result.exit_code == 0);
        REQUIRE(result.metadata["recompute_success"] == true);
    }

    SECTION("Script errors fail without retrying") {
        auto result = sandbox.Execute(Script("x = 1 / 0\n"));
        REQUIRE(result.status == ExecutionStatus::ExecutionFailed);
        REQUIRE(result.error.find("Script execution failed: division by zero") != std::string::npos);
        REQUIRE(result.metadata["retries"] == 1);
    }

    SECTION("Timeout is terminal") {
        SandboxConfig config;
        config.execution.timeout_seconds = 1.0;
        ScriptSandbox quick(config);

        auto result = quick.Execute(Script("while True:\n    pass\n"));
        REQUIRE(result.status == ExecutionStatus::Timeout);
        REQUIRE(result.metadata["retries"] == 1);
    }
}

TEST_CASE("ScriptSandbox - In-process mode", "[sandbox][inprocess]") {
    SandboxConfig config;
    config.execution.mode = ExecutionMode::InProcess;
    ScriptSandbox sandbox(config);

    auto result = sandbox.Execute(Script("print('ENTITY_CREATED: Box001')\n"));
    REQUIRE(result.success);
    REQUIRE(result.created_entities == std::vector<std::string>{"Box001"});
    REQUIRE(result.metadata["isolation"] == "reduced");
}
