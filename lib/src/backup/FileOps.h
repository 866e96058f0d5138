#pragma once

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <stdexcept>
#include <string>

namespace offload {

// Raised by the copy helpers; what() carries the system error text
class FileOpError : public std::runtime_error {
public:
    FileOpError(const std::string& operation, const std::string& path, int error_number);

    int ErrorNumber() const { return error_number_; }

private:
    int error_number_;
};

/**
 * Copy source to destination through a fixed-size buffer.
 * The destination is created or truncated. Throws FileOpError on any read,
 * write or close failure, leaving the partial destination for the caller to remove.
 *
 * @return Bytes written
 */
uint64_t StreamCopyFile(const std::string& source_path, const std::string& destination_path, size_t buffer_bytes);

// Set access and modification time of path; throws FileOpError
void SetModificationTime(const std::string& path, std::time_t mtime);

// Copy mode bits and timestamps from source to destination; throws FileOpError
void CopyFileAttributes(const std::string& source_path, const std::string& destination_path);

// Remove a file if present; returns false if it still exists afterwards
bool RemoveFileIfExists(const std::string& path);

} // namespace offload
