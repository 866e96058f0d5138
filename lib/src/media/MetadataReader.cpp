#include "MetadataReader.h"

#include <exiv2/exiv2.hpp>
#include <taglib/fileref.h>
#include <taglib/tag.h>
#include <taglib/mp4file.h>
#include <taglib/mp4tag.h>
#include <taglib/asffile.h>
#include <taglib/asftag.h>

namespace offload {

// EXIF keys in priority order
static const char* const EXIF_DATE_KEYS[] = {
    "Exif.Photo.DateTimeOriginal",
    "Exif.Photo.DateTimeDigitized",
    "Exif.Image.DateTime",
};

static const char* const XMP_DATE_KEYS[] = {
    "Xmp.exif.DateTimeOriginal",
    "Xmp.xmp.CreateDate",
};

MetadataReader::MetadataReader(LogCallback log_callback)
    : log_callback_(log_callback) {
}

void MetadataReader::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_(message);
    }
}

std::optional<CaptureDate> MetadataReader::ReadCaptureDate(const std::string& path, MediaCategory category) {
    switch (category) {
        case MediaCategory::Photo:
        case MediaCategory::Raw:
            return ReadExifDate(path);
        case MediaCategory::Video:
            return ReadVideoDate(path);
        default:
            return std::nullopt;
    }
}

std::optional<CaptureDate> MetadataReader::ReadExifDate(const std::string& path) {
    try {
        auto image = Exiv2::ImageFactory::open(path);
        if (!image.get()) {
            return std::nullopt;
        }
        image->readMetadata();

        auto& exif = image->exifData();
        for (const char* key : EXIF_DATE_KEYS) {
            auto it = exif.findKey(Exiv2::ExifKey(key));
            if (it == exif.end()) continue;
            if (auto date = ParseExifDate(it->toString())) {
                return date;
            }
        }

        // XMP dates are ISO 8601 ("2025-06-03T10:15:00")
        auto& xmp = image->xmpData();
        for (const char* key : XMP_DATE_KEYS) {
            auto it = xmp.findKey(Exiv2::XmpKey(key));
            if (it == xmp.end()) continue;
            if (auto date = ParseContainerDate(it->toString())) {
                return date;
            }
        }
    } catch (const std::exception& e) {
        Log("Warning: Could not read EXIF from " + path + ": " + std::string(e.what()));
    }
    return std::nullopt;
}

std::optional<CaptureDate> MetadataReader::ReadVideoDate(const std::string& path) {
    try {
        TagLib::FileRef fileRef(path.c_str());
        if (fileRef.isNull()) {
            return std::nullopt;
        }

        if (auto* f = dynamic_cast<TagLib::MP4::File*>(fileRef.file())) {
            if (f->tag() && f->tag()->contains("\251day")) {
                auto values = f->tag()->item("\251day").toStringList();
                if (!values.isEmpty()) {
                    if (auto date = ParseContainerDate(values.front().to8Bit(true))) {
                        return date;
                    }
                }
            }
        }
        if (auto* f = dynamic_cast<TagLib::ASF::File*>(fileRef.file())) {
            if (f->tag()) {
                auto& attrs = f->tag()->attributeListMap();
                if (attrs.contains("WM/EncodingTime") && !attrs["WM/EncodingTime"].isEmpty()) {
                    auto value = attrs["WM/EncodingTime"][0].toString().to8Bit(true);
                    if (auto date = ParseContainerDate(value)) {
                        return date;
                    }
                }
            }
        }
    } catch (const std::exception& e) {
        Log("Warning: Could not read container tags from " + path + ": " + std::string(e.what()));
    }
    return std::nullopt;
}

} // namespace offload
