#include "scriptbox/temp_script_file.h"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <vector>
#include <unistd.h>
#include <stdlib.h>

namespace scriptbox {

TempScriptFile::TempScriptFile(const std::string& directory) {
    std::string dir = directory;
    if (dir.empty()) {
        std::error_code ec;
        dir = std::filesystem::temp_directory_path(ec).string();
        if (ec || dir.empty()) {
            dir = "/tmp";
        }
    }

    std::string pattern = (std::filesystem::path(dir) / "scriptbox_XXXXXX.py").string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    fd_ = mkstemps(name.data(), 3);
    if (fd_ < 0) {
        error_ = fmt::format("Failed to create temporary file in {}: {}", dir, std::strerror(errno));
        spdlog::error("TempScriptFile: {}", error_);
        return;
    }
    path_ = name.data();
    spdlog::debug("TempScriptFile: created {}", path_);
}

TempScriptFile::~TempScriptFile() {
    Remove();
}

bool TempScriptFile::Write(const std::string& contents) {
    if (fd_ < 0) {
        if (error_.empty()) {
            error_ = "Temporary file is not open";
        }
        return false;
    }

    const char* data = contents.data();
    size_t remaining = contents.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_ = fmt::format("Failed to write {}: {}", path_, std::strerror(errno));
            spdlog::error("TempScriptFile: {}", error_);
            return false;
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }

    ::close(fd_);
    fd_ = -1;
    return true;
}

void TempScriptFile::Remove() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (!path_.empty()) {
        if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
            spdlog::warn("TempScriptFile: failed to remove {}: {}", path_, std::strerror(errno));
        }
        path_.clear();
    }
}

} // namespace scriptbox
