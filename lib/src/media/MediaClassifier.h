#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "../OffloadTypes.h"

namespace offload {

// Raised when a caller asks for the destination of an unsupported file
class UnsupportedCategoryError : public std::logic_error {
public:
    explicit UnsupportedCategoryError(const std::string& name)
        : std::logic_error("Unsupported media category for destination: " + name) {}
};

// Result of sniffing a file header
struct SniffResult {
    MediaCategory category = MediaCategory::CameraUnclassified;
    std::string extension;   // Canonical extension including the dot, empty if unknown
};

/**
 * MediaClassifier
 *
 * Stateless filename rules: category from extension, destination subfolder
 * from (category, date), and name repair for protocol listings that drop
 * extensions.
 */
class MediaClassifier {
public:
    static MediaCategory Classify(const std::string& filename);

    /**
     * Destination subfolder for a category and date.
     *
     * @return "{Label}_{YYYY}/{MM}/{DD}" with Label in Photos, Raw, Videos, Other
     * @throws UnsupportedCategoryError for MediaCategory::Unsupported
     */
    static std::string DestinationSubfolder(MediaCategory category, const CaptureDate& date);

    /**
     * Destination subfolder joined with the file name.
     *
     * @throws std::invalid_argument when the name is not a plain file name
     */
    static std::string DestinationRelativePath(const MediaFile& file);

    // False for "", ".", ".." and anything containing '/' or '\'
    static bool IsPlainFileName(const std::string& name);

    /**
     * Repair a protocol-reported name.
     *
     * Prefers the device's file-name property when it carries an extension.
     * Otherwise a camera-prefixed name without an extension is given ".ARW".
     * Any leading folder components are dropped. The result may still fail
     * IsPlainFileName ("..", names with '\') and must be checked by the caller.
     */
    static std::string RepairProtocolName(const std::string& reported_name,
                                          const std::string& file_name_property);

    // Identify a camera file from its first bytes (16 are enough)
    static SniffResult SniffCategory(const uint8_t* header, size_t size);

    static bool HasCameraPrefix(const std::string& filename);

    // Lowercased extension including the dot, empty if none
    static std::string Extension(const std::string& filename);

    static const std::vector<std::string>& PhotoExtensions();
    static const std::vector<std::string>& RawExtensions();
    static const std::vector<std::string>& VideoExtensions();
};

} // namespace offload
