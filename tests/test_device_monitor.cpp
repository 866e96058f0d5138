/**
 * test_device_monitor.cpp
 *
 * Unit tests for device discovery: mount table parsing, the poll diff in
 * DeviceMonitor, and the MTP enumerator's handling of open sessions.
 */

#include "lib/src/device/DeviceMonitor.h"
#include "lib/src/device/MtpDevice.h"
#include "tests/TestSupport.h"

using namespace offload;

// Enumerator whose device list the test sets directly
class ListEnumerator : public DeviceEnumerator {
public:
    std::vector<DeviceRecord> records;
    bool fail = false;

    std::vector<DeviceRecord> Enumerate() override {
        if (fail) {
            throw std::runtime_error("bus error");
        }
        return records;
    }
};

static DeviceRecord Record(const std::string& id, DeviceKind kind) {
    DeviceRecord record;
    record.id = id;
    record.display_name = id;
    record.kind = kind;
    return record;
}

bool TestMountTable() {
    std::cout << "Testing mount table parsing and the removable predicate..." << std::endl;

    TempDir dir("mounts");
    WriteFile(dir / "mounts",
              "/dev/sda2 / ext4 rw,relatime 0 0\n"
              "/dev/sdb1 /media/user/SD\\040CARD vfat rw,nosuid 0 0\n"
              "/dev/sdc1 /run/media/user/CAM exfat rw 0 0\n"
              "/dev/sdd1 /media/user/backup ext4 rw 0 0\n"
              "garbage\n");

    std::vector<MountEntry> entries = MountEnumerator::ReadMountTable(dir / "mounts");
    ASSERT_EQ(entries.size(), static_cast<size_t>(4), "Malformed line dropped");
    ASSERT_EQ(entries[1].mount_point, std::string("/media/user/SD CARD"), "Octal escape decoded");
    ASSERT_EQ(entries[1].fs_type, std::string("vfat"), "Filesystem type");

    ASSERT_FALSE(MountEnumerator::DefaultRemovablePredicate(entries[0]), "Root filesystem rejected");
    ASSERT_TRUE(MountEnumerator::DefaultRemovablePredicate(entries[1]), "FAT card under /media accepted");
    ASSERT_TRUE(MountEnumerator::DefaultRemovablePredicate(entries[2]), "exFAT card under /run/media accepted");
    ASSERT_FALSE(MountEnumerator::DefaultRemovablePredicate(entries[3]), "ext4 drive rejected");

    MountEnumerator enumerator(MountEnumerator::DefaultRemovablePredicate, dir / "mounts");
    std::vector<DeviceRecord> records = enumerator.Enumerate();
    ASSERT_EQ(records.size(), static_cast<size_t>(2), "Two removable sources");
    ASSERT_EQ(records[0].display_name, std::string("SD CARD"), "Display name from the mount point");
    ASSERT_TRUE(records[0].kind == DeviceKind::RemovableDrive, "Removable drive kind");

    ASSERT_TRUE(MountEnumerator::ReadMountTable(dir / "absent").empty(), "Missing table gives no entries");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestPollReportsChanges() {
    std::cout << "Testing device added and removed notifications..." << std::endl;

    auto owned = std::make_unique<ListEnumerator>();
    ListEnumerator* list = owned.get();
    std::vector<std::string> logs;
    DeviceMonitor monitor([&](const std::string& msg) { logs.push_back(msg); });
    monitor.AddEnumerator(std::move(owned));

    std::vector<std::string> added;
    std::vector<std::string> removed;
    auto on_added = [&](const DeviceRecord& record) { added.push_back(record.id); };
    auto on_removed = [&](const std::string& id) { removed.push_back(id); };

    list->records = {Record("/media/user/SD", DeviceKind::RemovableDrive), Record("MTP:ABC", DeviceKind::PortableProtocolDevice)};
    monitor.PollOnce(on_added, on_removed);
    ASSERT_EQ(added.size(), static_cast<size_t>(2), "Both devices reported");
    ASSERT_EQ(monitor.GetDevices().size(), static_cast<size_t>(2), "Both devices listed");

    monitor.PollOnce(on_added, on_removed);
    ASSERT_EQ(added.size(), static_cast<size_t>(2), "Unchanged devices not reported again");

    list->records = {Record("MTP:ABC", DeviceKind::PortableProtocolDevice)};
    monitor.PollOnce(on_added, on_removed);
    ASSERT_EQ(removed.size(), static_cast<size_t>(1), "Removal reported");
    ASSERT_EQ(removed[0], std::string("/media/user/SD"), "Removed device id");

    list->fail = true;
    monitor.PollOnce(on_added, on_removed);
    bool logged = std::any_of(logs.begin(), logs.end(), [](const std::string& msg) {
        return msg.rfind("Error enumerating devices", 0) == 0;
    });
    ASSERT_TRUE(logged, "Enumerator failure logged");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestOpenSessionsSkipUsb() {
    std::cout << "Testing MTP enumeration while a session is open..." << std::endl;

    ASSERT_TRUE(OpenMtpSessions::Records().empty(), "No sessions at start");

    DeviceRecord camera = Record("MTP:SER123", DeviceKind::PortableProtocolDevice);
    camera.display_name = "Sony ILCE-7M3";
    OpenMtpSessions::Add(camera);

    // Served from the open-session list; the USB bus is not opened
    MtpEnumerator enumerator;
    std::vector<DeviceRecord> records = enumerator.Enumerate();
    ASSERT_EQ(records.size(), static_cast<size_t>(1), "Open device still listed");
    ASSERT_EQ(records[0].id, std::string("MTP:SER123"), "Open device id");
    ASSERT_EQ(records[0].display_name, std::string("Sony ILCE-7M3"), "Open device name");

    // The monitor keeps the device instead of reporting it removed
    DeviceMonitor monitor;
    monitor.AddEnumerator(std::make_unique<MtpEnumerator>());
    std::vector<std::string> removed;
    monitor.PollOnce(nullptr, [&](const std::string& id) { removed.push_back(id); });
    monitor.PollOnce(nullptr, [&](const std::string& id) { removed.push_back(id); });
    ASSERT_TRUE(removed.empty(), "Open device not reported removed between polls");

    OpenMtpSessions::Add(camera);
    OpenMtpSessions::Remove(camera.id);
    ASSERT_EQ(OpenMtpSessions::Records().size(), static_cast<size_t>(1), "Second session keeps the entry");
    OpenMtpSessions::Remove(camera.id);
    ASSERT_TRUE(OpenMtpSessions::Records().empty(), "Last session removes the entry");
    OpenMtpSessions::Remove(camera.id);
    ASSERT_TRUE(OpenMtpSessions::Records().empty(), "Unknown id ignored");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestStorageFolderNames() {
    std::cout << "Testing storage folder names..." << std::endl;

    ASSERT_EQ(MtpDevice::StorageFolderName("Internal shared storage", "", 0),
              std::string("Internal shared storage"), "Description used");
    ASSERT_EQ(MtpDevice::StorageFolderName("", "SDCARD", 1), std::string("SDCARD"), "Volume label fallback");
    ASSERT_EQ(MtpDevice::StorageFolderName("", "", 1), std::string("Storage 2"), "Numbered fallback");
    ASSERT_EQ(MtpDevice::StorageFolderName("Card/Slot 1", "", 0), std::string("Card_Slot 1"), "Separators replaced");
    ASSERT_EQ(MtpDevice::StorageFolderName("..", "", 0), std::string("Storage 1"), "Parent reference replaced");

    std::cout << "  PASS" << std::endl;
    return true;
}

int main() {
    std::cout << "======================================" << std::endl;
    std::cout << " Device Discovery Unit Tests" << std::endl;
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

    run_test(TestMountTable, "Mount Table");
    run_test(TestPollReportsChanges, "Poll Reports Changes");
    run_test(TestOpenSessionsSkipUsb, "Open Sessions Skip USB");
    run_test(TestStorageFolderNames, "Storage Folder Names");

    std::cout << "======================================" << std::endl;
    std::cout << " Test Results: " << passed << "/" << total << " passed" << std::endl;
    std::cout << "======================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
