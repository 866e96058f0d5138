#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

namespace offload {

/**
 * Where a capture date came from, in the order the scanner tries them.
 */
enum class DateSource : uint8_t {
    EMBEDDED_METADATA = 0,   // EXIF / container tags
    SOURCE_PATH = 1,         // YYYY-MM-DD found in the path string
    DEVICE_REPORTED = 2,     // MTP CaptureDate / ModificationDate
    FILE_MODIFIED = 3,       // Filesystem mtime
    SCAN_TIME = 4,           // Wall clock at scan time
};

inline std::string DateSourceToString(DateSource source) {
    switch (source) {
        case DateSource::EMBEDDED_METADATA: return "EMBEDDED_METADATA";
        case DateSource::SOURCE_PATH:       return "SOURCE_PATH";
        case DateSource::DEVICE_REPORTED:   return "DEVICE_REPORTED";
        case DateSource::FILE_MODIFIED:     return "FILE_MODIFIED";
        case DateSource::SCAN_TIME:         return "SCAN_TIME";
        default:                            return "UNKNOWN";
    }
}

/**
 * CaptureDate
 *
 * Local calendar time a media file was captured. Only year/month/day are
 * needed for foldering; the time of day is kept so protocol copies can stamp
 * the destination mtime and later duplicate checks can compare against it.
 */
struct CaptureDate {
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    DateSource source = DateSource::SCAN_TIME;

    bool IsValid() const;

    // Interprets the fields as local time
    std::time_t ToTimeT() const;

    // "YYYY-MM-DD HH:MM:SS"
    std::string ToString() const;

    static CaptureDate FromTimeT(std::time_t t, DateSource source);
    static CaptureDate Now();

    bool operator==(const CaptureDate& other) const {
        return year == other.year && month == other.month && day == other.day &&
               hour == other.hour && minute == other.minute && second == other.second;
    }
    bool operator!=(const CaptureDate& other) const { return !(*this == other); }
};

// --- Parsers ---
// Each returns std::nullopt when the text does not hold a usable date.

// EXIF "YYYY:MM:DD HH:MM:SS" (DateTimeOriginal / DateTime)
std::optional<CaptureDate> ParseExifDate(const std::string& text);

// First "YYYY-MM-DD" occurrence anywhere in a path
std::optional<CaptureDate> ParsePathDate(const std::string& path);

// PTP date string "YYYYMMDDThhmmss[.s][Z|+hhmm]". Rejects the protocol zero
// date: empty strings, all-zero dates and anything at or before year 1900
// (the 1899-12-30 OLE default some devices report).
std::optional<CaptureDate> ParseDeviceDate(const std::string& text);

// ISO-like container tag "YYYY-MM-DD[ T]HH:MM:SS"; a bare year is not enough
std::optional<CaptureDate> ParseContainerDate(const std::string& text);

} // namespace offload
