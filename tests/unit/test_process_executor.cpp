#include <catch2/catch_test_macros.hpp>
#include <scriptbox/process_executor.h>
#include <scriptbox/temp_script_file.h>
#include <cerrno>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <stdlib.h>

namespace fs = std::filesystem;
using namespace scriptbox;

namespace {

// Scratch directory removed at scope exit
class ScratchDir {
public:
    ScratchDir() {
        std::string pattern = (fs::temp_directory_path() / "scriptbox_test_XXXXXX").string();
        if (::mkdtemp(pattern.data()) != nullptr) {
            path_ = pattern;
        }
    }
    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const std::string& GetPath() const { return path_; }
    bool IsEmpty() const { return fs::is_empty(path_); }

private:
    std::string path_;
};

ExecutionRequest MakeRequest(const std::string& text, std::chrono::milliseconds timeout) {
    ExecutionRequest request{Script(text)};
    request.timeout = timeout;
    return request;
}

ProcessExecutor MakeExecutor(const std::string& temp_dir) {
    ProcessOptions options;
    options.temp_directory = temp_dir;
    return ProcessExecutor(options, SymbolPolicy::Default());
}

// Throws from the launch step, after the wrapper file has been written
class FailingLaunchExecutor : public ProcessExecutor {
public:
    explicit FailingLaunchExecutor(ProcessOptions options)
        : ProcessExecutor(std::move(options), SymbolPolicy::Default()) {}

    std::vector<std::string> BuildCommand(const std::string& script_path) const override {
        file_existed_ = fs::exists(script_path);
        throw std::runtime_error("launcher unavailable");
    }

    bool FileExisted() const { return file_existed_; }

private:
    mutable bool file_existed_ = false;
};

} // anonymous namespace

// ========== TempScriptFile Tests ==========

TEST_CASE("TempScriptFile - Lifecycle", "[process][tempfile]") {
    ScratchDir scratch;
    REQUIRE_FALSE(scratch.GetPath().empty());

    std::string path;
    {
        TempScriptFile file(scratch.GetPath());
        REQUIRE(file.IsValid());
        REQUIRE(file.Write("print('hi')\n"));
        path = file.GetPath();
        REQUIRE(fs::path(path).extension() == ".py");

        std::ifstream in(path);
        std::string line;
        std::getline(in, line);
        REQUIRE(line == "print('hi')");
    }
    REQUIRE_FALSE(fs::exists(path));
    REQUIRE(scratch.IsEmpty());

    SECTION("Removed when the scope unwinds through an exception") {
        std::string thrown_path;
        try {
            TempScriptFile file(scratch.GetPath());
            REQUIRE(file.Write("while True:\n    pass\n"));
            thrown_path = file.GetPath();
            throw std::runtime_error("render aborted");
        } catch (const std::runtime_error& e) {
            REQUIRE(std::string(e.what()) == "render aborted");
        }
        REQUIRE_FALSE(thrown_path.empty());
        REQUIRE_FALSE(fs::exists(thrown_path));
        REQUIRE(scratch.IsEmpty());
    }

    SECTION("Missing directory reports an error") {
        TempScriptFile file(scratch.GetPath() + "/missing");
        REQUIRE_FALSE(file.IsValid());
        REQUIRE_FALSE(file.GetError().empty());
    }
}

// ========== Command Tests ==========

TEST_CASE("ProcessExecutor - Command line", "[process]") {
    SECTION("Plain interpreter") {
        ProcessExecutor executor;
        REQUIRE(executor.BuildCommand("/tmp/s.py") == std::vector<std::string>{"python3", "/tmp/s.py"});
        REQUIRE(std::string(executor.GetModeName()) == "subprocess");
    }

    SECTION("AppImage gets console mode") {
        ProcessOptions options;
        options.interpreter = "/opt/FreeCAD_0.21.2-Linux-x86_64.AppImage";
        ProcessExecutor executor(options, SymbolPolicy::Default());
        REQUIRE(executor.BuildCommand("/tmp/s.py") ==
                std::vector<std::string>{options.interpreter, "--console", "/tmp/s.py"});
    }

    SECTION("Interpreter arguments precede the script") {
        ProcessOptions options;
        options.interpreter_args = {"-I", "-B"};
        ProcessExecutor executor(options, SymbolPolicy::Default());
        REQUIRE(executor.BuildCommand("s.py") == std::vector<std::string>{"python3", "-I", "-B", "s.py"});
    }

    SECTION("AppImage detection ignores case") {
        REQUIRE(ProcessExecutor::IsAppImage("FreeCAD.appimage"));
        REQUIRE(ProcessExecutor::IsAppImage("/x/FreeCAD.AppImage"));
        REQUIRE_FALSE(ProcessExecutor::IsAppImage("freecadcmd"));
        REQUIRE_FALSE(ProcessExecutor::IsAppImage("image"));
    }
}

// ========== Execution Tests ==========

TEST_CASE("ProcessExecutor - Successful run", "[process]") {
    ScratchDir scratch;
    auto executor = MakeExecutor(scratch.GetPath());

    auto result = executor.Execute(MakeRequest("print('ENTITY_CREATED: Box001')\n",
                                               std::chrono::seconds(30)));

    REQUIRE(result.status == ExecutionStatus::Success);
    REQUIRE(result.success);
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.output.find("SCRIPT_START") != std::string::npos);
    REQUIRE(result.output.find("ENTITY_CREATED: Box001") != std::string::npos);
    REQUIRE(result.output.find("RECOMPUTE_SUCCESS") != std::string::npos);
    REQUIRE(result.output.find("EXECUTION_COMPLETE") != std::string::npos);
    REQUIRE(result.metadata["execution_mode"] == "subprocess");
    REQUIRE(result.metadata["isolation"] == "process");
    REQUIRE(result.metadata.contains("pid"));

    // The rendered wrapper is gone
    REQUIRE(scratch.IsEmpty());
}

TEST_CASE("ProcessExecutor - Context reaches the script", "[process]") {
    ScratchDir scratch;
    auto executor = MakeExecutor(scratch.GetPath());

    ExecutionRequest request{Script("print('width=' + str(_context['width']))\n", {{"width", 42}})};
    auto result = executor.Execute(request);

    REQUIRE(result.success);
    REQUIRE(result.output.find("width=42") != std::string::npos);
}

TEST_CASE("ProcessExecutor - Script failure", "[process]") {
    ScratchDir scratch;
    auto executor = MakeExecutor(scratch.GetPath());

    SECTION("Raised exception") {
        auto result = executor.Execute(MakeRequest("raise ValueError('bad   input')\n",
                                                   std::chrono::seconds(30)));
        REQUIRE(result.status == ExecutionStatus::ExecutionFailed);
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.output.find("ERROR: Script execution failed: bad input") != std::string::npos);
        REQUIRE(result.error.find("ValueError") != std::string::npos);
    }

    SECTION("Guarded import rejects blocked modules at runtime") {
        auto result = executor.Execute(MakeRequest("import os\n", std::chrono::seconds(30)));
        REQUIRE(result.status == ExecutionStatus::ExecutionFailed);
        REQUIRE(result.output.find("is blocked in sandbox environment") != std::string::npos);
    }

    SECTION("Restricted builtins hide blocked names") {
        auto result = executor.Execute(MakeRequest("open('/etc/hostname')\n", std::chrono::seconds(30)));
        REQUIRE(result.status == ExecutionStatus::ExecutionFailed);
        REQUIRE(result.output.find("'open' is not defined") != std::string::npos);
    }

    REQUIRE(scratch.IsEmpty());
}

TEST_CASE("ProcessExecutor - Timeout kills the process", "[process][timeout]") {
    ScratchDir scratch;
    auto executor = MakeExecutor(scratch.GetPath());

    auto started = std::chrono::steady_clock::now();
    auto result = executor.Execute(MakeRequest("while True:\n    pass\n", std::chrono::seconds(1)));
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(result.status == ExecutionStatus::Timeout);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == "Script execution timed out after 1 seconds");
    REQUIRE_FALSE(result.exit_code.has_value());
    REQUIRE(elapsed < std::chrono::seconds(10));

    // Reaped before Execute() returned
    pid_t pid = result.metadata["pid"].get<pid_t>();
    errno = 0;
    REQUIRE(::kill(pid, 0) == -1);
    REQUIRE(errno == ESRCH);

    REQUIRE(scratch.IsEmpty());
}

TEST_CASE("ProcessExecutor - Spawn failures", "[process]") {
    ScratchDir scratch;

    SECTION("Missing interpreter") {
        ProcessOptions options;
        options.interpreter = "/nonexistent/scriptbox-python";
        options.temp_directory = scratch.GetPath();
        ProcessExecutor executor(options, SymbolPolicy::Default());

        auto result = executor.Execute(MakeRequest("print(1)\n", std::chrono::seconds(5)));
        REQUIRE(result.status == ExecutionStatus::UnknownError);
        REQUIRE(result.error.find("Failed to start interpreter") != std::string::npos);
    }

    SECTION("Missing working directory") {
        auto executor = MakeExecutor(scratch.GetPath());
        auto request = MakeRequest("print(1)\n", std::chrono::seconds(5));
        request.working_dir = scratch.GetPath() + "/missing";

        auto result = executor.Execute(request);
        REQUIRE(result.status == ExecutionStatus::UnknownError);
        REQUIRE(result.error.find("Failed to enter working directory") != std::string::npos);
    }

    REQUIRE(scratch.IsEmpty());
}

TEST_CASE("ProcessExecutor - Exception after the wrapper is written", "[process][tempfile]") {
    ScratchDir scratch;
    ProcessOptions options;
    options.temp_directory = scratch.GetPath();
    FailingLaunchExecutor executor(options);

    auto result = executor.Execute(MakeRequest("print(1)\n", std::chrono::seconds(5)));

    REQUIRE(executor.FileExisted());
    REQUIRE(result.status == ExecutionStatus::UnknownError);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == "Execution error: launcher unavailable");
    REQUIRE(scratch.IsEmpty());
}

TEST_CASE("ProcessExecutor - Descendant holding the output pipes", "[process]") {
    ScratchDir scratch;
    ProcessOptions options;
    options.temp_directory = scratch.GetPath();
    // sh exits at once; the background sleep keeps stdout open
    options.interpreter = "/bin/sh";
    options.interpreter_args = {"-c", "sleep 30 & echo launched", "sh"};
    ProcessExecutor executor(options, SymbolPolicy::Default());

    auto started = std::chrono::steady_clock::now();
    auto result = executor.Execute(MakeRequest("print(1)\n", std::chrono::seconds(10)));
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(result.status == ExecutionStatus::Success);
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.output.find("launched") != std::string::npos);
    REQUIRE(elapsed < std::chrono::seconds(5));
    REQUIRE(scratch.IsEmpty());
}

TEST_CASE("ProcessExecutor - Format fields yield text only", "[process][security]") {
    ScratchDir scratch;
    auto executor = MakeExecutor(scratch.GetPath());

    auto result = executor.Execute(MakeRequest(
        "def g():\n"
        "    yield 1\n"
        "f = g()\n"
        "s = '{0.gi_frame.f_builtins}'.format(f)\n"
        "print('FORMAT_TYPE ' + type(s).__name__)\n"
        "s['__import__']\n",
        std::chrono::seconds(30)));

    REQUIRE(result.output.find("FORMAT_TYPE str") != std::string::npos);
    REQUIRE(result.status == ExecutionStatus::ExecutionFailed);
    REQUIRE(result.error.find("TypeError") != std::string::npos);
}

TEST_CASE("ProcessExecutor - Working directory", "[process]") {
    ScratchDir scratch;
    ScratchDir workdir;
    auto executor = MakeExecutor(scratch.GetPath());

    auto request = MakeRequest("print('ok')\n", std::chrono::seconds(30));
    request.working_dir = workdir.GetPath();

    auto result = executor.Execute(request);
    REQUIRE(result.success);
}

TEST_CASE("ProcessExecutor - Output cap", "[process]") {
    ScratchDir scratch;
    ProcessOptions options;
    options.temp_directory = scratch.GetPath();
    options.max_output_bytes = 1024;
    ProcessExecutor executor(options, SymbolPolicy::Default());

    auto result = executor.Execute(MakeRequest("print('x' * 100000)\n", std::chrono::seconds(30)));
    REQUIRE(result.success);
    REQUIRE(result.output.size() <= 1024);
    REQUIRE(result.metadata["output_truncated"] == true);
}

TEST_CASE("ProcessExecutor - Version probe", "[process]") {
    ProcessExecutor executor;
    auto version = executor.ProbeVersion();
    REQUIRE(version.has_value());
    REQUIRE(version->rfind("Python 3.", 0) == 0);
}
