/**
 * test_media_classifier.cpp
 *
 * Unit tests for MediaClassifier: extension rules, destination folders,
 * protocol name repair and header sniffing.
 */

#include "lib/src/media/MediaClassifier.h"
#include "tests/TestSupport.h"

using namespace offload;

bool TestClassifyByExtension() {
    std::cout << "Testing classification by extension..." << std::endl;

    ASSERT_TRUE(MediaClassifier::Classify("a.jpg") == MediaCategory::Photo, "jpg is a photo");
    ASSERT_TRUE(MediaClassifier::Classify("B.JPEG") == MediaCategory::Photo, "JPEG is a photo regardless of case");
    ASSERT_TRUE(MediaClassifier::Classify("shot.HEIC") == MediaCategory::Photo, "HEIC is a photo");
    ASSERT_TRUE(MediaClassifier::Classify("scan.tif") == MediaCategory::Photo, "tif is a photo");
    ASSERT_TRUE(MediaClassifier::Classify("DSC01234.ARW") == MediaCategory::Raw, "ARW is raw");
    ASSERT_TRUE(MediaClassifier::Classify("x.nef") == MediaCategory::Raw, "nef is raw");
    ASSERT_TRUE(MediaClassifier::Classify("x.CR3") == MediaCategory::Raw, "CR3 is raw");
    ASSERT_TRUE(MediaClassifier::Classify("x.dng") == MediaCategory::Raw, "dng is raw");
    ASSERT_TRUE(MediaClassifier::Classify("b.mp4") == MediaCategory::Video, "mp4 is video");
    ASSERT_TRUE(MediaClassifier::Classify("C0001.MTS") == MediaCategory::Video, "MTS is video");
    ASSERT_TRUE(MediaClassifier::Classify("clip.m2ts") == MediaCategory::Video, "m2ts is video");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestClassifyCameraAndUnsupported() {
    std::cout << "Testing camera prefixes and unsupported names..." << std::endl;

    ASSERT_TRUE(MediaClassifier::Classify("DSC01234") == MediaCategory::CameraUnclassified, "DSC prefix without extension");
    ASSERT_TRUE(MediaClassifier::Classify("_DSC0001") == MediaCategory::CameraUnclassified, "_DSC prefix");
    ASSERT_TRUE(MediaClassifier::Classify("img_4411") == MediaCategory::CameraUnclassified, "IMG_ prefix is case-insensitive");
    ASSERT_TRUE(MediaClassifier::Classify("P1000123") == MediaCategory::CameraUnclassified, "P10 prefix");
    ASSERT_TRUE(MediaClassifier::Classify("DSC01234.xmp") == MediaCategory::CameraUnclassified,
                "Unknown extension with camera prefix");

    ASSERT_TRUE(MediaClassifier::Classify("notes.txt") == MediaCategory::Unsupported, "txt is unsupported");
    ASSERT_TRUE(MediaClassifier::Classify("README") == MediaCategory::Unsupported, "No extension, no prefix");
    ASSERT_TRUE(MediaClassifier::Classify(".jpg") == MediaCategory::Unsupported, "Leading dot is not an extension");
    ASSERT_TRUE(MediaClassifier::Classify("") == MediaCategory::Unsupported, "Empty name");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestExtension() {
    std::cout << "Testing extension extraction..." << std::endl;

    ASSERT_EQ(MediaClassifier::Extension("a.JPG"), std::string(".jpg"), "Lowercased with dot");
    ASSERT_EQ(MediaClassifier::Extension("archive.tar.gz"), std::string(".gz"), "Last dot wins");
    ASSERT_EQ(MediaClassifier::Extension("dir.d/file"), std::string(""), "Dot in directory is ignored");
    ASSERT_EQ(MediaClassifier::Extension(".hidden"), std::string(""), "Hidden file has no extension");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestDestinationSubfolder() {
    std::cout << "Testing destination subfolders..." << std::endl;

    CaptureDate date;
    date.year = 2024;
    date.month = 3;
    date.day = 7;

    ASSERT_EQ(MediaClassifier::DestinationSubfolder(MediaCategory::Photo, date), std::string("Photos_2024/03/07"), "Photo folder");
    ASSERT_EQ(MediaClassifier::DestinationSubfolder(MediaCategory::Raw, date), std::string("Raw_2024/03/07"), "Raw folder");
    ASSERT_EQ(MediaClassifier::DestinationSubfolder(MediaCategory::Video, date), std::string("Videos_2024/03/07"), "Video folder");
    ASSERT_EQ(MediaClassifier::DestinationSubfolder(MediaCategory::CameraUnclassified, date),
              std::string("Photos_2024/03/07"), "Unresolved camera files go with photos");

    // Pure for a fixed input
    ASSERT_EQ(MediaClassifier::DestinationSubfolder(MediaCategory::Video, date),
              MediaClassifier::DestinationSubfolder(MediaCategory::Video, date), "Repeated calls agree");

    MediaFile file;
    file.name = "a.jpg";
    file.category = MediaCategory::Photo;
    file.capture_date = date;
    ASSERT_EQ(MediaClassifier::DestinationRelativePath(file), std::string("Photos_2024/03/07/a.jpg"), "Relative path");

    bool threw = false;
    try {
        MediaClassifier::DestinationSubfolder(MediaCategory::Unsupported, date);
    } catch (const UnsupportedCategoryError&) {
        threw = true;
    }
    ASSERT_TRUE(threw, "Unsupported category must be rejected");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestRepairProtocolName() {
    std::cout << "Testing protocol name repair..." << std::endl;

    ASSERT_EQ(MediaClassifier::RepairProtocolName("DSC01234", "DSC01234.ARW"), std::string("DSC01234.ARW"),
              "File-name property with extension wins");
    ASSERT_EQ(MediaClassifier::RepairProtocolName("DSC01234", ""), std::string("DSC01234.ARW"),
              "Camera name without extension gets .ARW");
    ASSERT_EQ(MediaClassifier::RepairProtocolName("DSC01234", "DSC01234"), std::string("DSC01234.ARW"),
              "Property without extension is ignored");
    ASSERT_EQ(MediaClassifier::RepairProtocolName("holiday.jpg", ""), std::string("holiday.jpg"),
              "Name with extension is unchanged");
    ASSERT_EQ(MediaClassifier::RepairProtocolName("notes", ""), std::string("notes"),
              "Non-camera name without extension is unchanged");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestSniffCategory() {
    std::cout << "Testing header sniffing..." << std::endl;

    const uint8_t jpeg[] = {0xFF, 0xD8, 0xFF, 0xE1, 0, 0, 0, 0};
    SniffResult r = MediaClassifier::SniffCategory(jpeg, sizeof(jpeg));
    ASSERT_TRUE(r.category == MediaCategory::Photo, "JPEG magic is a photo");
    ASSERT_EQ(r.extension, std::string(".JPG"), "JPEG extension");

    const uint8_t tiff[] = {'I', 'I', 0x2A, 0x00, 8, 0, 0, 0};
    r = MediaClassifier::SniffCategory(tiff, sizeof(tiff));
    ASSERT_TRUE(r.category == MediaCategory::Raw, "TIFF container is raw");

    const uint8_t cr3[] = {0, 0, 0, 0x18, 'f', 't', 'y', 'p', 'c', 'r', 'x', ' '};
    r = MediaClassifier::SniffCategory(cr3, sizeof(cr3));
    ASSERT_TRUE(r.category == MediaCategory::Raw, "crx brand is raw");
    ASSERT_EQ(r.extension, std::string(".CR3"), "CR3 extension");

    const uint8_t mp4[] = {0, 0, 0, 0x18, 'f', 't', 'y', 'p', 'i', 's', 'o', 'm'};
    r = MediaClassifier::SniffCategory(mp4, sizeof(mp4));
    ASSERT_TRUE(r.category == MediaCategory::Video, "isom brand is video");
    ASSERT_EQ(r.extension, std::string(".MP4"), "MP4 extension");

    const uint8_t heic[] = {0, 0, 0, 0x18, 'f', 't', 'y', 'p', 'h', 'e', 'i', 'c'};
    r = MediaClassifier::SniffCategory(heic, sizeof(heic));
    ASSERT_TRUE(r.category == MediaCategory::Photo, "heic brand is a photo");

    const uint8_t unknown[] = {'A', 'B', 'C', 'D', 'E', 'F'};
    r = MediaClassifier::SniffCategory(unknown, sizeof(unknown));
    ASSERT_TRUE(r.category == MediaCategory::CameraUnclassified, "Unknown bytes stay unresolved");
    ASSERT_TRUE(r.extension.empty(), "No extension for unknown bytes");

    r = MediaClassifier::SniffCategory(jpeg, 2);
    ASSERT_TRUE(r.category == MediaCategory::CameraUnclassified, "Too few bytes stay unresolved");

    std::cout << "  PASS" << std::endl;
    return true;
}

int main() {
    std::cout << "======================================" << std::endl;
    std::cout << " MediaClassifier Unit Tests" << std::endl;
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

    run_test(TestClassifyByExtension, "Classify By Extension");
    run_test(TestClassifyCameraAndUnsupported, "Camera Prefixes And Unsupported");
    run_test(TestExtension, "Extension Extraction");
    run_test(TestDestinationSubfolder, "Destination Subfolder");
    run_test(TestRepairProtocolName, "Protocol Name Repair");
    run_test(TestSniffCategory, "Header Sniffing");

    std::cout << "======================================" << std::endl;
    std::cout << " Test Results: " << passed << "/" << total << " passed" << std::endl;
    std::cout << "======================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
