#include "SourceDevice.h"

#include <sys/stat.h>
#include <unistd.h>

namespace offload {

bool IsDirectoryAccessible(const std::string& path, bool need_write) {
    if (path.empty()) {
        return false;
    }
    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        return false;
    }
    int mode = need_write ? (R_OK | W_OK) : R_OK;
    return access(path.c_str(), mode) == 0;
}

FilesystemDevice::FilesystemDevice(const std::string& root_path, const std::string& display_name)
    : root_path_(root_path), display_name_(display_name.empty() ? root_path : display_name) {
}

bool FilesystemDevice::IsReachable() {
    return IsDirectoryAccessible(root_path_, false);
}

} // namespace offload
