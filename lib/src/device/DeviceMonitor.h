#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../OffloadTypes.h"

namespace offload {

/**
 * Produces the current list of candidate source devices.
 * Implementations decide what counts as a media source; the pipeline only
 * reads id and kind from the records.
 */
class DeviceEnumerator {
public:
    virtual ~DeviceEnumerator() = default;
    virtual std::vector<DeviceRecord> Enumerate() = 0;
};

// One line of the mount table
struct MountEntry {
    std::string device;       // e.g. /dev/sdb1
    std::string mount_point;  // e.g. /media/user/SDCARD
    std::string fs_type;      // e.g. vfat, exfat
};

// Decides whether a mounted filesystem should be offered as a source
using RemovableMediaPredicate = std::function<bool(const MountEntry&)>;

/**
 * Lists mounted filesystems from /proc/mounts and keeps the ones the
 * predicate accepts. Capacity and free space come from statvfs.
 */
class MountEnumerator : public DeviceEnumerator {
public:
    explicit MountEnumerator(RemovableMediaPredicate predicate = DefaultRemovablePredicate,
                             const std::string& mount_table = "/proc/mounts");

    std::vector<DeviceRecord> Enumerate() override;

    static std::vector<MountEntry> ReadMountTable(const std::string& mount_table);

    // Mount point under /media, /run/media or /mnt with a FAT/exFAT/NTFS filesystem
    static bool DefaultRemovablePredicate(const MountEntry& entry);

private:
    RemovableMediaPredicate predicate_;
    std::string mount_table_;
};

/**
 * DeviceMonitor
 *
 * Polls a set of enumerators on a background thread and reports devices
 * that appear or disappear between polls.
 */
class DeviceMonitor {
public:
    using DeviceAddedCallback = std::function<void(const DeviceRecord&)>;
    using DeviceRemovedCallback = std::function<void(const std::string& device_id)>;

    explicit DeviceMonitor(LogCallback log_callback = nullptr);
    ~DeviceMonitor();

    void AddEnumerator(std::unique_ptr<DeviceEnumerator> enumerator);

    // Start polling in a background thread
    void StartBackground(DeviceAddedCallback on_added, DeviceRemovedCallback on_removed,
                         std::chrono::milliseconds interval = std::chrono::milliseconds(1000));

    void Stop();

    // Run one enumeration pass and report changes; used by the poll loop
    void PollOnce(const DeviceAddedCallback& on_added, const DeviceRemovedCallback& on_removed);

    std::vector<DeviceRecord> GetDevices() const;

    bool IsRunning() const { return running_; }

private:
    LogCallback log_callback_;
    std::vector<std::unique_ptr<DeviceEnumerator>> enumerators_;
    std::mutex enumerators_mutex_;

    std::atomic<bool> running_;
    std::thread poll_thread_;
    mutable std::mutex devices_mutex_;
    std::map<std::string, DeviceRecord> devices_;   // id -> record

    void PollLoop(DeviceAddedCallback on_added, DeviceRemovedCallback on_removed,
                  std::chrono::milliseconds interval);
    void Log(const std::string& message);
};

} // namespace offload
