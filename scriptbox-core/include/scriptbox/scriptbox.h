#pragma once

// Main header file for scriptbox
// Include this to get access to all sandbox functionality

#define SCRIPTBOX_VERSION_MAJOR 0
#define SCRIPTBOX_VERSION_MINOR 1
#define SCRIPTBOX_VERSION_PATCH 0

// API export macros
#include "api_export.h"

// Value types and policy (no dependencies first)
#include "result.h"
#include "symbol_policy.h"
#include "marker_protocol.h"

// Embedded interpreter and static validation
#include "python_engine.h"
#include "script_validator.h"

// Execution
#include "script_template.h"
#include "output_parser.h"
#include "executor.h"
#include "process_executor.h"
#include "in_process_executor.h"
#include "execution_slots.h"
#include "retry_orchestrator.h"

// Configuration, logging and the facade
#include "config.h"
#include "config_manager.h"
#include "logging.h"
#include "sandbox.h"

namespace scriptbox {

// Starts the embedded interpreter used by the validator and in-process mode
SCRIPTBOX_API bool Initialize();

// Finalizes the interpreter if Initialize() started it
SCRIPTBOX_API void Shutdown();

SCRIPTBOX_API const char* GetVersionString();

} // namespace scriptbox
