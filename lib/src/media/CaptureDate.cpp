#include "CaptureDate.h"

#include <cstdio>
#include <regex>

namespace offload {

// Smallest year a device-reported date may carry
constexpr int MIN_DEVICE_YEAR = 1901;

static bool InRange(int value, int lo, int hi) {
    return value >= lo && value <= hi;
}

static std::optional<CaptureDate> Build(int y, int mo, int d, int h, int mi, int s, DateSource source) {
    CaptureDate date;
    date.year = y;
    date.month = mo;
    date.day = d;
    date.hour = h;
    date.minute = mi;
    date.second = s;
    date.source = source;
    if (!date.IsValid()) {
        return std::nullopt;
    }
    return date;
}

bool CaptureDate::IsValid() const {
    if (year < 1 || !InRange(month, 1, 12)) return false;

    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int max_day = days_in_month[month - 1];
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && leap) max_day = 29;

    return InRange(day, 1, max_day) && InRange(hour, 0, 23) &&
           InRange(minute, 0, 59) && InRange(second, 0, 60);
}

std::time_t CaptureDate::ToTimeT() const {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}

std::string CaptureDate::ToString() const {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d",
                  year, month, day, hour, minute, second);
    return buffer;
}

CaptureDate CaptureDate::FromTimeT(std::time_t t, DateSource source) {
    std::tm tm{};
    localtime_r(&t, &tm);

    CaptureDate date;
    date.year = tm.tm_year + 1900;
    date.month = tm.tm_mon + 1;
    date.day = tm.tm_mday;
    date.hour = tm.tm_hour;
    date.minute = tm.tm_min;
    date.second = tm.tm_sec;
    date.source = source;
    return date;
}

CaptureDate CaptureDate::Now() {
    return FromTimeT(std::time(nullptr), DateSource::SCAN_TIME);
}

std::optional<CaptureDate> ParseExifDate(const std::string& text) {
    static const std::regex exif_pattern(
        R"(^\s*(\d{4}):(\d{2}):(\d{2})[ T](\d{2}):(\d{2}):(\d{2}))"
    );
    std::smatch m;
    if (!std::regex_search(text, m, exif_pattern)) {
        return std::nullopt;
    }
    return Build(std::stoi(m[1]), std::stoi(m[2]), std::stoi(m[3]),
                 std::stoi(m[4]), std::stoi(m[5]), std::stoi(m[6]),
                 DateSource::EMBEDDED_METADATA);
}

std::optional<CaptureDate> ParsePathDate(const std::string& path) {
    static const std::regex path_pattern(R"((\d{4})-(\d{2})-(\d{2}))");

    // A path may carry several candidates (e.g. "2025-13-01/2025-06-03"); take the first valid one
    auto begin = std::sregex_iterator(path.begin(), path.end(), path_pattern);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const std::smatch& m = *it;
        auto date = Build(std::stoi(m[1]), std::stoi(m[2]), std::stoi(m[3]), 0, 0, 0,
                          DateSource::SOURCE_PATH);
        if (date) {
            return date;
        }
    }
    return std::nullopt;
}

std::optional<CaptureDate> ParseDeviceDate(const std::string& text) {
    static const std::regex ptp_pattern(
        R"(^(\d{4})(\d{2})(\d{2})T(\d{2})(\d{2})(\d{2}))"
    );
    std::smatch m;
    if (text.empty() || !std::regex_search(text, m, ptp_pattern)) {
        return std::nullopt;
    }
    int year = std::stoi(m[1]);
    if (year < MIN_DEVICE_YEAR) {
        return std::nullopt;
    }
    return Build(year, std::stoi(m[2]), std::stoi(m[3]),
                 std::stoi(m[4]), std::stoi(m[5]), std::stoi(m[6]),
                 DateSource::DEVICE_REPORTED);
}

std::optional<CaptureDate> ParseContainerDate(const std::string& text) {
    static const std::regex full_pattern(
        R"(^\s*(\d{4})-(\d{2})-(\d{2})(?:[ T](\d{2}):(\d{2}):(\d{2}))?)"
    );
    std::smatch m;
    if (std::regex_search(text, m, full_pattern)) {
        int h = m[4].matched ? std::stoi(m[4]) : 0;
        int mi = m[5].matched ? std::stoi(m[5]) : 0;
        int s = m[6].matched ? std::stoi(m[6]) : 0;
        return Build(std::stoi(m[1]), std::stoi(m[2]), std::stoi(m[3]), h, mi, s,
                     DateSource::EMBEDDED_METADATA);
    }
    return std::nullopt;
}

} // namespace offload
