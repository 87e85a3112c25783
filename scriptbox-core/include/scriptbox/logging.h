// logging.h - spdlog setup for the library and runner
#pragma once

#include "api_export.h"
#include <string>

namespace scriptbox {

// Installs a colored stderr sink and, when `file` is set, a file sink as the
// default spdlog logger. Returns false if the level name or file is invalid;
// logging still works through the sinks that could be created.
SCRIPTBOX_API bool InitializeLogging(const std::string& level, const std::string& file = "");

} // namespace scriptbox
