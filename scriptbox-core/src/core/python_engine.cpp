#include "scriptbox/python_engine.h"
#include <pybind11/embed.h>
#include <spdlog/spdlog.h>

namespace py = pybind11;

namespace scriptbox {

PythonEngine::PythonEngine() = default;

PythonEngine::~PythonEngine() {
    Shutdown();
}

bool PythonEngine::IsInterpreterRunning() {
    return Py_IsInitialized() != 0;
}

bool PythonEngine::Initialize() {
    if (initialized_) {
        return true;
    }

    if (IsInterpreterRunning()) {
        // Owned by the host application or an earlier engine; never finalized here
        spdlog::info("PythonEngine: attaching to running interpreter (Python {})", GetVersion());
        initialized_ = true;
        initialized_by_us_ = false;
        return true;
    }

    try {
        // Signal handlers stay with the host process
        py::initialize_interpreter(false);
    } catch (const std::exception& e) {
        spdlog::error("PythonEngine: interpreter startup failed: {}", e.what());
        return false;
    }

    initialized_ = true;
    initialized_by_us_ = true;
    spdlog::info("PythonEngine: started Python {}", GetVersion());

    // Validator and executor threads take the GIL with gil_scoped_acquire
    ReleaseGIL();
    return true;
}

void PythonEngine::Shutdown() {
    if (!initialized_) {
        return;
    }

    if (initialized_by_us_) {
        AcquireGIL();
        py::finalize_interpreter();
        spdlog::info("PythonEngine: interpreter finalized");
    }

    initialized_ = false;
    initialized_by_us_ = false;
    main_thread_state_ = nullptr;
}

std::string PythonEngine::GetVersion() const {
    // "3.11.4 (main, ...) [GCC ...]" -> "3.11.4"
    std::string version = Py_GetVersion();
    return version.substr(0, version.find(' '));
}

void PythonEngine::ReleaseGIL() {
    if (main_thread_state_ == nullptr) {
        main_thread_state_ = PyEval_SaveThread();
    }
}

void PythonEngine::AcquireGIL() {
    if (main_thread_state_ != nullptr) {
        PyEval_RestoreThread(main_thread_state_);
        main_thread_state_ = nullptr;
    }
}

} // namespace scriptbox
