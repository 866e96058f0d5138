#pragma once

#include <optional>
#include <string>

#include "../OffloadTypes.h"

namespace offload {

/**
 * MetadataReader
 *
 * Reads the embedded capture date from a local file.
 * Photos and RAW files go through Exiv2 (EXIF, then XMP); videos go through
 * TagLib container tags (MP4 "\251day", ASF "WM/EncodingTime").
 *
 * All readers return std::nullopt on failure and report the reason through
 * the log callback; a missing date is not an error for the caller.
 */
class MetadataReader {
public:
    explicit MetadataReader(LogCallback log_callback = nullptr);

    std::optional<CaptureDate> ReadCaptureDate(const std::string& path, MediaCategory category);

    std::optional<CaptureDate> ReadExifDate(const std::string& path);
    std::optional<CaptureDate> ReadVideoDate(const std::string& path);

private:
    LogCallback log_callback_;

    void Log(const std::string& message);
};

} // namespace offload
