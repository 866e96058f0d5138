#include "FileOps.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace offload {

FileOpError::FileOpError(const std::string& operation, const std::string& path, int error_number)
    : std::runtime_error(operation + " " + path + ": " + std::strerror(error_number)),
      error_number_(error_number) {
}

// Closes a descriptor on scope exit unless released
class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() { if (fd_ >= 0) ::close(fd_); }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int Get() const { return fd_; }
    int Release() { int fd = fd_; fd_ = -1; return fd; }

private:
    int fd_;
};

uint64_t StreamCopyFile(const std::string& source_path, const std::string& destination_path, size_t buffer_bytes) {
    ScopedFd in(::open(source_path.c_str(), O_RDONLY));
    if (in.Get() < 0) {
        throw FileOpError("open", source_path, errno);
    }
    ScopedFd out(::open(destination_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
    if (out.Get() < 0) {
        throw FileOpError("create", destination_path, errno);
    }

    std::vector<char> buffer(buffer_bytes > 0 ? buffer_bytes : 1024 * 1024);
    uint64_t total = 0;

    while (true) {
        ssize_t got = ::read(in.Get(), buffer.data(), buffer.size());
        if (got < 0) {
            if (errno == EINTR) continue;
            throw FileOpError("read", source_path, errno);
        }
        if (got == 0) break;

        ssize_t written = 0;
        while (written < got) {
            ssize_t n = ::write(out.Get(), buffer.data() + written, static_cast<size_t>(got - written));
            if (n < 0) {
                if (errno == EINTR) continue;
                throw FileOpError("write", destination_path, errno);
            }
            written += n;
        }
        total += static_cast<uint64_t>(got);
    }

    if (::fsync(out.Get()) != 0 && errno != EINVAL) {
        throw FileOpError("sync", destination_path, errno);
    }
    if (::close(out.Release()) != 0) {
        throw FileOpError("close", destination_path, errno);
    }
    return total;
}

void SetModificationTime(const std::string& path, std::time_t mtime) {
    struct timespec times[2];
    times[0].tv_sec = mtime;
    times[0].tv_nsec = 0;
    times[1].tv_sec = mtime;
    times[1].tv_nsec = 0;
    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
        throw FileOpError("set time on", path, errno);
    }
}

void CopyFileAttributes(const std::string& source_path, const std::string& destination_path) {
    struct stat st;
    if (::stat(source_path.c_str(), &st) != 0) {
        throw FileOpError("stat", source_path, errno);
    }
    // FAT/exFAT destinations reject permission changes
    if (::chmod(destination_path.c_str(), st.st_mode & 07777) != 0 && errno != EPERM && errno != ENOTSUP) {
        throw FileOpError("chmod", destination_path, errno);
    }

    struct timespec times[2] = {st.st_atim, st.st_mtim};
    if (::utimensat(AT_FDCWD, destination_path.c_str(), times, 0) != 0) {
        throw FileOpError("set time on", destination_path, errno);
    }
}

bool RemoveFileIfExists(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return !std::filesystem::exists(path, ec);
}

} // namespace offload
