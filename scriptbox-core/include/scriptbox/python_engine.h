#pragma once

#include <Python.h>
#include "api_export.h"
#include <string>

namespace scriptbox {

/**
 * PythonEngine - Embedded interpreter lifecycle
 *
 * The validator parses scripts with the interpreter's `ast` module and the
 * in-process executor runs the wrapper program inside it. Only one
 * interpreter exists per process; a second engine reuses it.
 *
 * After Initialize() the GIL is released, so callers on any thread must take
 * it with pybind11::gil_scoped_acquire.
 */
class SCRIPTBOX_API PythonEngine {
public:
    PythonEngine();
    ~PythonEngine();

    PythonEngine(const PythonEngine&) = delete;
    PythonEngine& operator=(const PythonEngine&) = delete;

    bool Initialize();
    void Shutdown();

    bool IsInitialized() const { return initialized_; }
    std::string GetVersion() const;

    // GIL management for multi-threaded use
    void ReleaseGIL();
    void AcquireGIL();

    static bool IsInterpreterRunning();

private:
    bool initialized_ = false;
    bool initialized_by_us_ = false;  // True if we called py::initialize_interpreter()
    PyThreadState* main_thread_state_ = nullptr;  // Saved when releasing GIL
};

} // namespace scriptbox
