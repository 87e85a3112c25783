// temp_script_file.h - Scoped temporary file holding a rendered wrapper
#pragma once

#include "api_export.h"
#include <string>

namespace scriptbox {

// Created with mkstemps(); the file is unlinked when the object goes away.
class SCRIPTBOX_API TempScriptFile {
public:
    // Empty directory = system temp directory
    explicit TempScriptFile(const std::string& directory = "");
    ~TempScriptFile();

    TempScriptFile(const TempScriptFile&) = delete;
    TempScriptFile& operator=(const TempScriptFile&) = delete;

    bool Write(const std::string& contents);
    void Remove();

    bool IsValid() const { return !path_.empty(); }
    const std::string& GetPath() const { return path_; }
    const std::string& GetError() const { return error_; }

private:
    std::string path_;
    std::string error_;
    int fd_ = -1;
};

} // namespace scriptbox
