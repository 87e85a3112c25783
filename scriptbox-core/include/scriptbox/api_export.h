#pragma once

// This header includes the CMake-generated export header
// and provides the SCRIPTBOX_API macro

#include "scriptbox/scriptbox_export.h"

#ifndef SCRIPTBOX_API
    #define SCRIPTBOX_API SCRIPTBOX_EXPORT
#endif
