// marker_protocol.h - Line markers emitted by the wrapper program
//
// These strings cross the process boundary. Changing one breaks every
// deployed wrapper/parser pair.
#pragma once

namespace scriptbox::markers {

// Parsed
constexpr const char* kEntityCreated = "ENTITY_CREATED:";
constexpr const char* kError = "ERROR:";
constexpr const char* kWarning = "WARNING:";
constexpr const char* kCompletion = "RECOMPUTE_SUCCESS";

// Informational, emitted but not interpreted
constexpr const char* kDocumentCreated = "DOCUMENT_CREATED:";
constexpr const char* kScriptStart = "SCRIPT_START";
constexpr const char* kRecomputeStart = "RECOMPUTE_START";
constexpr const char* kScriptSuccess = "SCRIPT_SUCCESS";
constexpr const char* kExecutionComplete = "EXECUTION_COMPLETE";

} // namespace scriptbox::markers
