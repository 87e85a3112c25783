// config_manager.h - YAML configuration loading/saving
#pragma once

#include "api_export.h"
#include "config.h"
#include <string>

namespace scriptbox {

class SCRIPTBOX_API ConfigManager {
public:
    ConfigManager();
    ~ConfigManager() = default;

    // Load config from YAML file into internal cache
    bool Load(const std::string& path);

    // Missing file -> defaults and true; parse error -> defaults and false
    bool LoadConfig(const std::string& path, SandboxConfig& config);

    // Parse YAML text (used for inline configs and tests)
    bool LoadFromString(const std::string& yaml_text, SandboxConfig& config);

    // Save cached config to the last loaded path
    bool Save();

    bool SaveConfig(const SandboxConfig& config, const std::string& path);

    const SandboxConfig& GetConfig() const { return cached_config_; }
    void SetConfig(const SandboxConfig& config) { cached_config_ = config; }

    static SandboxConfig GetDefaultConfig();

    // SCRIPTBOX_CONFIG, ./scriptbox.yaml, ~/.config/scriptbox/scriptbox.yaml
    static std::string FindConfigFile();

private:
    std::string last_loaded_path_;
    SandboxConfig cached_config_;
};

} // namespace scriptbox
