#include "scriptbox/logging.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <vector>

namespace scriptbox {

bool InitializeLogging(const std::string& level, const std::string& file) {
    bool ok = true;

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string file_error;
    if (!file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
            ok = false;
        }
    }

    auto logger = std::make_shared<spdlog::logger>("scriptbox", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);

    // from_str() maps unknown names to "off"
    spdlog::level::level_enum parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("Logging: unknown level '{}', using info", level);
        ok = false;
    } else {
        spdlog::set_level(parsed);
    }

    if (!file_error.empty()) {
        spdlog::error("Logging: cannot open log file {}: {}", file, file_error);
    }
    return ok;
}

} // namespace scriptbox
