#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "media/CaptureDate.h"

namespace offload {

using LogCallback = std::function<void(const std::string& message)>;

// --- Media ---

enum class MediaCategory : uint8_t {
    Photo = 0,
    Raw = 1,
    Video = 2,
    CameraUnclassified = 3,   // Vendor-prefixed name without a known extension
    Unsupported = 4,
};

inline std::string MediaCategoryToString(MediaCategory category) {
    switch (category) {
        case MediaCategory::Photo:              return "photo";
        case MediaCategory::Raw:                return "raw";
        case MediaCategory::Video:              return "video";
        case MediaCategory::CameraUnclassified: return "camera";
        case MediaCategory::Unsupported:        return "unsupported";
        default:                                return "unknown";
    }
}

enum class AddressingMode : uint8_t {
    Filesystem = 0,
    Protocol = 1,
};

// How to read a file's bytes. For protocol sources the handle is only
// meaningful together with the ProtocolDevice passed into the same call.
struct SourceLocator {
    AddressingMode mode = AddressingMode::Filesystem;
    std::string path;            // Absolute path, or device-relative path for protocol items
    uint32_t object_handle = 0;  // Protocol item id (0 for filesystem sources)
};

struct MediaFile {
    std::string name;            // Display name, possibly repaired
    std::string original_name;   // Name as reported by the source
    SourceLocator source;
    uint64_t size_bytes = 0;
    MediaCategory category = MediaCategory::Unsupported;
    CaptureDate capture_date;
};

// --- Devices ---

enum class DeviceKind : uint8_t {
    RemovableDrive = 0,
    PortableProtocolDevice = 1,
    Manual = 2,
};

inline std::string DeviceKindToString(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::RemovableDrive:         return "RemovableDrive";
        case DeviceKind::PortableProtocolDevice: return "PortableProtocolDevice";
        case DeviceKind::Manual:                 return "Manual";
        default:                                 return "Unknown";
    }
}

struct DeviceRecord {
    std::string id;              // Mount path, or "MTP:<serial>"
    std::string display_name;
    DeviceKind kind = DeviceKind::Manual;
    uint64_t capacity_bytes = 0;
    uint64_t free_bytes = 0;

    bool operator==(const DeviceRecord& other) const {
        return id == other.id;
    }
};

// --- Errors ---

enum class ErrorKind : uint8_t {
    None = 0,
    ClassificationSkip,
    DuplicateCheckFailure,
    FilenameCollisionExhausted,
    CopyVerificationMismatch,
    DeviceDisconnection,
    FatalSessionError,
    CopyFailed,              // Any other per-file failure
};

inline std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                       return "None";
        case ErrorKind::ClassificationSkip:         return "ClassificationSkip";
        case ErrorKind::DuplicateCheckFailure:      return "DuplicateCheckFailure";
        case ErrorKind::FilenameCollisionExhausted: return "FilenameCollisionExhausted";
        case ErrorKind::CopyVerificationMismatch:   return "CopyVerificationMismatch";
        case ErrorKind::DeviceDisconnection:        return "DeviceDisconnection";
        case ErrorKind::FatalSessionError:          return "FatalSessionError";
        case ErrorKind::CopyFailed:                 return "CopyFailed";
        default:                                    return "Unknown";
    }
}

// --- Copy results ---

enum class CopyStatus : uint8_t {
    Copied = 0,
    SkippedDuplicate = 1,
    Failed = 2,
};

struct CopyOutcome {
    CopyStatus status = CopyStatus::Failed;
    ErrorKind error = ErrorKind::None;
    std::string reason;            // Failure detail (empty unless Failed)
    std::string destination_path;  // Written path for Copied, existing path for SkippedDuplicate

    static CopyOutcome Copied(const std::string& path) {
        return {CopyStatus::Copied, ErrorKind::None, "", path};
    }
    static CopyOutcome Skipped(const std::string& path) {
        return {CopyStatus::SkippedDuplicate, ErrorKind::None, "", path};
    }
    static CopyOutcome Failed(ErrorKind error, const std::string& reason) {
        return {CopyStatus::Failed, error, reason, ""};
    }
};

} // namespace offload
