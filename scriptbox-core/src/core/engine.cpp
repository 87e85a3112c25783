#include "scriptbox/scriptbox.h"
#include <spdlog/spdlog.h>
#include <cstdio>
#include <memory>

namespace scriptbox {

static std::unique_ptr<PythonEngine> g_engine;

bool Initialize() {
    if (g_engine) {
        spdlog::warn("scriptbox already initialized");
        return true;
    }

    spdlog::info("Initializing scriptbox v{}.{}.{}",
                 SCRIPTBOX_VERSION_MAJOR,
                 SCRIPTBOX_VERSION_MINOR,
                 SCRIPTBOX_VERSION_PATCH);

    auto engine = std::make_unique<PythonEngine>();
    if (!engine->Initialize()) {
        spdlog::error("scriptbox: embedded Python runtime unavailable");
        return false;
    }

    g_engine = std::move(engine);
    return true;
}

void Shutdown() {
    if (!g_engine) {
        return;
    }

    spdlog::info("Shutting down scriptbox");
    g_engine->Shutdown();
    g_engine.reset();
}

const char* GetVersionString() {
    static char version[32];
    snprintf(version, sizeof(version), "%d.%d.%d",
             SCRIPTBOX_VERSION_MAJOR,
             SCRIPTBOX_VERSION_MINOR,
             SCRIPTBOX_VERSION_PATCH);
    return version;
}

} // namespace scriptbox
