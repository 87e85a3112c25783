#include "scriptbox/in_process_executor.h"
#include "scriptbox/python_engine.h"
#include <pybind11/pybind11.h>
#include <pybind11/eval.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace py = pybind11;

namespace scriptbox {

namespace {

// Deriving from BaseException keeps `except Exception` in scripts from catching it
const char* kWatchdogCode = R"PY(
import sys
import time

class ScriptTimeout(BaseException):
    pass

class Watchdog:
    def __init__(self, timeout_seconds):
        self.timeout_seconds = timeout_seconds
        self.deadline = None
        self.previous_trace = None

    def start(self):
        self.deadline = time.monotonic() + self.timeout_seconds
        self.previous_trace = sys.gettrace()
        sys.settrace(self._trace)

    def stop(self):
        sys.settrace(self.previous_trace)
        self.previous_trace = None

    def _trace(self, frame, event, arg):
        if time.monotonic() > self.deadline:
            raise ScriptTimeout(f"Execution timeout exceeded ({self.timeout_seconds}s)")
        return self._trace
)PY";

// Swaps sys.stdout/sys.stderr for StringIO buffers for the lifetime of the object.
// Requires the GIL.
class StreamCapture {
public:
    StreamCapture() {
        sys_ = py::module_::import("sys");
        py::module_ io = py::module_::import("io");
        stdout_capture_ = io.attr("StringIO")();
        stderr_capture_ = io.attr("StringIO")();
        original_stdout_ = sys_.attr("stdout");
        original_stderr_ = sys_.attr("stderr");
        sys_.attr("stdout") = stdout_capture_;
        sys_.attr("stderr") = stderr_capture_;
    }

    ~StreamCapture() {
        try {
            sys_.attr("stdout") = original_stdout_;
            sys_.attr("stderr") = original_stderr_;
        } catch (const py::error_already_set& e) {
            spdlog::error("InProcessExecutor: failed to restore streams: {}", e.what());
        }
    }

    StreamCapture(const StreamCapture&) = delete;
    StreamCapture& operator=(const StreamCapture&) = delete;

    std::string Stdout() const { return py::str(stdout_capture_.attr("getvalue")()); }
    std::string Stderr() const { return py::str(stderr_capture_.attr("getvalue")()); }

private:
    py::module_ sys_;
    py::object stdout_capture_;
    py::object stderr_capture_;
    py::object original_stdout_;
    py::object original_stderr_;
};

// SystemExit.code -> process-style exit code
int ExitCodeFromSystemExit(const py::error_already_set& e) {
    py::object code = e.value().attr("code");
    if (code.is_none()) {
        return 0;
    }
    if (py::isinstance<py::int_>(code)) {
        return code.cast<int>();
    }
    return 1;
}

} // anonymous namespace

InProcessExecutor::InProcessExecutor()
    : InProcessExecutor(SymbolPolicy::Default())
{
}

InProcessExecutor::InProcessExecutor(SymbolPolicy policy, HostProfile host, std::string document_name)
    : policy_(std::move(policy))
    , host_(host)
    , document_name_(std::move(document_name))
    , template_(policy_)
{
}

ExecutionResult InProcessExecutor::Execute(const ExecutionRequest& request) {
    auto start = std::chrono::steady_clock::now();

    ExecutionResult result = ExecutionResult::Make(ExecutionStatus::UnknownError);
    result.metadata["execution_mode"] = GetModeName();
    result.metadata["isolation"] = "reduced";
    result.metadata["warning"] = kIsolationWarning;
    if (!request.script.GetRequestId().empty()) {
        result.metadata["request_id"] = request.script.GetRequestId();
    }

    auto finish = [&]() {
        result.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        return result;
    };

    if (!PythonEngine::IsInterpreterRunning()) {
        result.error = "Python runtime not initialized";
        spdlog::error("InProcessExecutor: {}", result.error);
        return finish();
    }

    if (request.working_dir && !request.working_dir->empty()) {
        spdlog::warn("InProcessExecutor: working directory '{}' ignored in in-process mode",
                     *request.working_dir);
    }

    ScriptTemplate::Options render_options;
    render_options.host = host_;
    render_options.document_name = document_name_;
    render_options.reduced_builtins = true;

    std::lock_guard<std::mutex> lock(run_mutex_);

    try {
        std::string wrapper = template_.Render(request.script, render_options);

        py::gil_scoped_acquire gil;

        py::dict watchdog_scope;
        watchdog_scope["__builtins__"] = py::module_::import("builtins");
        py::exec(kWatchdogCode, watchdog_scope);
        py::object timeout_type = watchdog_scope["ScriptTimeout"];
        double timeout_seconds = static_cast<double>(request.timeout.count()) / 1000.0;
        py::object watchdog = watchdog_scope["Watchdog"](timeout_seconds);

        py::dict wrapper_scope;
        wrapper_scope["__builtins__"] = py::module_::import("builtins");
        wrapper_scope["__name__"] = "__scriptbox__";

        int exit_code = 0;
        bool timed_out = false;
        std::string failure;
        {
            StreamCapture capture;
            watchdog.attr("start")();
            try {
                py::exec(wrapper, wrapper_scope);
            } catch (py::error_already_set& e) {
                if (e.matches(PyExc_SystemExit)) {
                    exit_code = ExitCodeFromSystemExit(e);
                } else if (e.matches(timeout_type)) {
                    timed_out = true;
                } else {
                    exit_code = 1;
                    failure = e.what();
                }
            }
            watchdog.attr("stop")();

            result.output = capture.Stdout();
            result.metadata["stderr"] = capture.Stderr();
        }

        if (timed_out) {
            result.SetStatus(ExecutionStatus::Timeout);
            result.error = fmt::format("Script execution timed out after {:g} seconds", timeout_seconds);
            spdlog::warn("InProcessExecutor: {}", result.error);
        } else if (exit_code == 0) {
            result.SetStatus(ExecutionStatus::Success);
        } else {
            result.SetStatus(ExecutionStatus::ExecutionFailed);
            result.metadata["exit_status"] = exit_code;
            result.error = failure.empty()
                ? fmt::format("Script exited with code {}", exit_code)
                : failure;
        }
    } catch (const py::error_already_set& e) {
        result.SetStatus(ExecutionStatus::UnknownError);
        result.error = fmt::format("Python error: {}", e.what());
        spdlog::error("InProcessExecutor: {}", result.error);
    } catch (const std::exception& e) {
        result.SetStatus(ExecutionStatus::UnknownError);
        result.error = fmt::format("Execution error: {}", e.what());
        spdlog::error("InProcessExecutor: {}", result.error);
    }

    return finish();
}

} // namespace scriptbox
