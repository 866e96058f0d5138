#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "../OffloadTypes.h"

namespace offload {

/**
 * SourceDevice
 *
 * A place media files are read from. The addressing mode decides how the
 * scanner walks it and how the copy engine reads bytes from it.
 */
class SourceDevice {
public:
    virtual ~SourceDevice() = default;

    virtual std::string Id() const = 0;
    virtual std::string DisplayName() const = 0;
    virtual AddressingMode Mode() const = 0;

    // Cheap liveness check, called before every file copy
    virtual bool IsReachable() = 0;
};

// A mounted drive or a plain directory
class FilesystemDevice : public SourceDevice {
public:
    explicit FilesystemDevice(const std::string& root_path, const std::string& display_name = "");

    std::string Id() const override { return root_path_; }
    std::string DisplayName() const override { return display_name_; }
    AddressingMode Mode() const override { return AddressingMode::Filesystem; }
    bool IsReachable() override;

    const std::string& RootPath() const { return root_path_; }

private:
    std::string root_path_;
    std::string display_name_;
};

// One entry of a protocol listing
struct ProtocolItem {
    uint32_t handle = 0;
    std::string name;                 // Name as listed
    std::string file_name_property;   // Device file-name property, may carry the extension the listing lost
    uint64_t size = 0;
    bool is_folder = false;
    std::string capture_date;         // PTP date string, may be empty
    std::string modification_date;    // PTP date string, may be empty
};

/**
 * ProtocolDevice
 *
 * A device addressed through its own object protocol (MTP). Object handles
 * are only valid while the device stays connected, so they are passed
 * together with the device reference for the duration of one call and never
 * kept across sessions.
 *
 * ListChildren and ReadObjectChunk throw std::runtime_error (or the
 * transport's exception) on failure; DownloadObject reports through its
 * return value.
 */
class ProtocolDevice : public SourceDevice {
public:
    // Root handle: lists every storage
    static constexpr uint32_t ROOT_HANDLE = 0;

    AddressingMode Mode() const override { return AddressingMode::Protocol; }

    virtual std::vector<ProtocolItem> ListChildren(uint32_t parent_handle) = 0;

    // Device-native transfer of a whole object into a local file
    virtual bool DownloadObject(uint32_t handle, const std::string& destination_path) = 0;

    // Partial read; returns bytes appended to out (0 at end of object)
    virtual size_t ReadObjectChunk(uint32_t handle, uint64_t offset, size_t size, std::vector<uint8_t>& out) = 0;
};

// Path exists, is a directory and grants the requested access
bool IsDirectoryAccessible(const std::string& path, bool need_write);

} // namespace offload
