#include "MediaClassifier.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace offload {

// Vendor prefixes seen on camera filenames (Sony/Nikon DSC, Canon IMG_, Fuji DSCF, Panasonic P10)
static const char* const CAMERA_PREFIXES[] = {"DSC", "_DSC", "IMG_", "P10"};

// Extension Sony bodies use for RAW when the listing drops it
static const char* const DEFAULT_CAMERA_EXTENSION = ".ARW";

static std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string ToUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static bool Contains(const std::vector<std::string>& set, const std::string& ext) {
    return std::find(set.begin(), set.end(), ext) != set.end();
}

const std::vector<std::string>& MediaClassifier::PhotoExtensions() {
    static const std::vector<std::string> exts = {
        ".jpg", ".jpeg", ".png", ".bmp", ".gif", ".heic", ".webp", ".tiff", ".tif"
    };
    return exts;
}

const std::vector<std::string>& MediaClassifier::RawExtensions() {
    static const std::vector<std::string> exts = {
        ".cr2", ".nef", ".arw", ".orf", ".rw2", ".dng", ".raf", ".sr2", ".pef", ".raw", ".crw", ".cr3"
    };
    return exts;
}

const std::vector<std::string>& MediaClassifier::VideoExtensions() {
    static const std::vector<std::string> exts = {
        ".mp4", ".mov", ".avi", ".mkv", ".mts", ".m2ts", ".wmv", ".flv", ".3gp", ".m4v", ".mpg", ".mpeg"
    };
    return exts;
}

std::string MediaClassifier::Extension(const std::string& filename) {
    size_t slash = filename.find_last_of("/\\");
    size_t start = (slash == std::string::npos) ? 0 : slash + 1;
    size_t dot = filename.find_last_of('.');
    // A leading dot (".hidden") is not an extension
    if (dot == std::string::npos || dot <= start) {
        return "";
    }
    return ToLower(filename.substr(dot));
}

bool MediaClassifier::HasCameraPrefix(const std::string& filename) {
    std::string upper = ToUpper(filename);
    for (const char* prefix : CAMERA_PREFIXES) {
        if (upper.compare(0, std::strlen(prefix), prefix) == 0) {
            return true;
        }
    }
    return false;
}

MediaCategory MediaClassifier::Classify(const std::string& filename) {
    std::string ext = Extension(filename);
    if (!ext.empty()) {
        if (Contains(PhotoExtensions(), ext)) return MediaCategory::Photo;
        if (Contains(RawExtensions(), ext)) return MediaCategory::Raw;
        if (Contains(VideoExtensions(), ext)) return MediaCategory::Video;
    }
    if (HasCameraPrefix(filename)) {
        return MediaCategory::CameraUnclassified;
    }
    return MediaCategory::Unsupported;
}

std::string MediaClassifier::DestinationSubfolder(MediaCategory category, const CaptureDate& date) {
    const char* label = nullptr;
    switch (category) {
        case MediaCategory::Photo:
        case MediaCategory::CameraUnclassified:
            label = "Photos";
            break;
        case MediaCategory::Raw:
            label = "Raw";
            break;
        case MediaCategory::Video:
            label = "Videos";
            break;
        case MediaCategory::Unsupported:
            throw UnsupportedCategoryError(MediaCategoryToString(category));
    }
    if (!label) {
        label = "Other";
    }

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%s_%04d/%02d/%02d", label, date.year, date.month, date.day);
    return buffer;
}

std::string MediaClassifier::DestinationRelativePath(const MediaFile& file) {
    if (!IsPlainFileName(file.name)) {
        throw std::invalid_argument("Not a plain file name: \"" + file.name + "\"");
    }
    return DestinationSubfolder(file.category, file.capture_date) + "/" + file.name;
}

bool MediaClassifier::IsPlainFileName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of("/\\") == std::string::npos;
}

std::string MediaClassifier::RepairProtocolName(const std::string& reported_name,
                                                const std::string& file_name_property) {
    std::string name;
    if (!file_name_property.empty() && file_name_property.find('.') != std::string::npos) {
        name = file_name_property;
    } else if (reported_name.find('.') == std::string::npos && HasCameraPrefix(reported_name)) {
        name = reported_name + DEFAULT_CAMERA_EXTENSION;
    } else {
        name = reported_name;
    }

    // Devices may report folder components; only the last one names the file
    size_t slash = name.find_last_of('/');
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    return name;
}

SniffResult MediaClassifier::SniffCategory(const uint8_t* header, size_t size) {
    SniffResult result;
    if (!header || size < 4) {
        return result;
    }

    if (header[0] == 0xFF && header[1] == 0xD8 && header[2] == 0xFF) {
        result.category = MediaCategory::Photo;
        result.extension = ".JPG";
    } else if ((header[0] == 'I' && header[1] == 'I' && header[2] == 0x2A && header[3] == 0x00) ||
               (header[0] == 'M' && header[1] == 'M' && header[2] == 0x00 && header[3] == 0x2A)) {
        // TIFF container: ARW/NEF/DNG/CR2 all use it
        result.category = MediaCategory::Raw;
        result.extension = ".ARW";
    } else if (size >= 12 && std::memcmp(header + 4, "ftyp", 4) == 0) {
        if (std::memcmp(header + 8, "crx ", 4) == 0) {
            result.category = MediaCategory::Raw;
            result.extension = ".CR3";
        } else if (std::memcmp(header + 8, "heic", 4) == 0 || std::memcmp(header + 8, "mif1", 4) == 0) {
            result.category = MediaCategory::Photo;
            result.extension = ".HEIC";
        } else if (std::memcmp(header + 8, "qt  ", 4) == 0) {
            result.category = MediaCategory::Video;
            result.extension = ".MOV";
        } else {
            result.category = MediaCategory::Video;
            result.extension = ".MP4";
        }
    } else if (size >= 12 && std::memcmp(header, "RIFF", 4) == 0 && std::memcmp(header + 8, "AVI ", 4) == 0) {
        result.category = MediaCategory::Video;
        result.extension = ".AVI";
    } else if (std::memcmp(header, "\x89PNG", 4) == 0) {
        result.category = MediaCategory::Photo;
        result.extension = ".PNG";
    }
    return result;
}

} // namespace offload
