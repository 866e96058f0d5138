/**
 * test_capture_date.cpp
 *
 * Unit tests for the capture date parsers
 */

#include "lib/src/media/CaptureDate.h"
#include "tests/TestSupport.h"

using namespace offload;

bool TestExifDate() {
    std::cout << "Testing EXIF date parsing..." << std::endl;

    auto date = ParseExifDate("2023:11:05 14:22:09");
    ASSERT_TRUE(date.has_value(), "Standard EXIF date parses");
    ASSERT_EQ(date->year, 2023, "Year");
    ASSERT_EQ(date->month, 11, "Month");
    ASSERT_EQ(date->day, 5, "Day");
    ASSERT_EQ(date->hour, 14, "Hour");
    ASSERT_EQ(date->second, 9, "Second");
    ASSERT_TRUE(date->source == DateSource::EMBEDDED_METADATA, "Source is metadata");

    ASSERT_FALSE(ParseExifDate("0000:00:00 00:00:00").has_value(), "Zero EXIF date rejected");
    ASSERT_FALSE(ParseExifDate("2023:02:30 10:00:00").has_value(), "Impossible day rejected");
    ASSERT_FALSE(ParseExifDate("").has_value(), "Empty string rejected");
    ASSERT_FALSE(ParseExifDate("yesterday").has_value(), "Free text rejected");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestPathDate() {
    std::cout << "Testing path date parsing..." << std::endl;

    auto date = ParsePathDate("/media/card/DCIM/2022-08-19/DSC0001.ARW");
    ASSERT_TRUE(date.has_value(), "Date folder parses");
    ASSERT_EQ(date->year, 2022, "Year");
    ASSERT_EQ(date->month, 8, "Month");
    ASSERT_EQ(date->day, 19, "Day");
    ASSERT_TRUE(date->source == DateSource::SOURCE_PATH, "Source is path");

    date = ParsePathDate("trip_2021-13-40/2021-06-03 beach.jpg");
    ASSERT_TRUE(date.has_value(), "Later valid candidate is used");
    ASSERT_EQ(date->month, 6, "First valid candidate month");

    ASSERT_FALSE(ParsePathDate("/DCIM/100MSDCF/DSC0001.JPG").has_value(), "No date in path");
    ASSERT_FALSE(ParsePathDate("20220819.jpg").has_value(), "Compact digits are not a path date");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestDeviceDate() {
    std::cout << "Testing device date parsing..." << std::endl;

    auto date = ParseDeviceDate("20240102T030405");
    ASSERT_TRUE(date.has_value(), "PTP date parses");
    ASSERT_EQ(date->year, 2024, "Year");
    ASSERT_EQ(date->minute, 4, "Minute");
    ASSERT_TRUE(date->source == DateSource::DEVICE_REPORTED, "Source is device");

    ASSERT_TRUE(ParseDeviceDate("20240102T030405.0Z").has_value(), "Fractional and zone suffix accepted");
    ASSERT_FALSE(ParseDeviceDate("").has_value(), "Empty date rejected");
    ASSERT_FALSE(ParseDeviceDate("00000000T000000").has_value(), "All-zero date rejected");
    ASSERT_FALSE(ParseDeviceDate("18991230T000000").has_value(), "OLE zero date rejected");
    ASSERT_FALSE(ParseDeviceDate("19000101T000000").has_value(), "Year 1900 rejected");
    ASSERT_TRUE(ParseDeviceDate("19010101T000000").has_value(), "Year 1901 accepted");
    ASSERT_FALSE(ParseDeviceDate("2024-01-02 03:04:05").has_value(), "ISO format is not a device date");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestContainerDate() {
    std::cout << "Testing container date parsing..." << std::endl;

    auto date = ParseContainerDate("2019-07-04T18:30:00Z");
    ASSERT_TRUE(date.has_value(), "ISO timestamp parses");
    ASSERT_EQ(date->hour, 18, "Hour");

    date = ParseContainerDate("2019-07-04");
    ASSERT_TRUE(date.has_value(), "Date without time parses");
    ASSERT_EQ(date->hour, 0, "Missing time is midnight");

    ASSERT_FALSE(ParseContainerDate("2019").has_value(), "Bare year rejected");
    ASSERT_FALSE(ParseContainerDate("").has_value(), "Empty rejected");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestTimeConversion() {
    std::cout << "Testing time_t conversion..." << std::endl;

    CaptureDate date;
    date.year = 2020;
    date.month = 2;
    date.day = 29;
    date.hour = 12;
    date.minute = 34;
    date.second = 56;
    ASSERT_TRUE(date.IsValid(), "Leap day is valid");

    CaptureDate back = CaptureDate::FromTimeT(date.ToTimeT(), DateSource::FILE_MODIFIED);
    ASSERT_TRUE(back == date, "Local time survives the round trip");
    ASSERT_TRUE(back.source == DateSource::FILE_MODIFIED, "Source is taken from the caller");
    ASSERT_EQ(date.ToString(), std::string("2020-02-29 12:34:56"), "String form");

    CaptureDate now = CaptureDate::Now();
    ASSERT_TRUE(now.IsValid(), "Now is valid");
    ASSERT_TRUE(now.source == DateSource::SCAN_TIME, "Now is tagged as scan time");

    std::cout << "  PASS" << std::endl;
    return true;
}

int main() {
    std::cout << "======================================" << std::endl;
    std::cout << " CaptureDate Unit Tests" << std::endl;
    std::cout << "======================================" << std::endl << std::endl;

    int passed = 0;
    int total = 0;

    auto run_test = [&](bool (*test_func)(), const std::string& name) {
        total++;
        if (test_func()) {
            passed++;
        } else {
            std::cout << "  TEST FAILED: " << name << std::endl;
        }
        std::cout << std::endl;
    };

    run_test(TestExifDate, "EXIF Date");
    run_test(TestPathDate, "Path Date");
    run_test(TestDeviceDate, "Device Date");
    run_test(TestContainerDate, "Container Date");
    run_test(TestTimeConversion, "time_t Conversion");

    std::cout << "======================================" << std::endl;
    std::cout << " Test Results: " << passed << "/" << total << " passed" << std::endl;
    std::cout << "======================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
