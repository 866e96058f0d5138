#include "DeviceMonitor.h"

#include <fstream>
#include <sstream>
#include <set>
#include <sys/statvfs.h>

namespace offload {

// Slice the poll wait so Stop() does not block for a whole interval
constexpr auto POLL_SLICE = std::chrono::milliseconds(100);

// /proc/mounts escapes whitespace as octal ("\040" for space)
static std::string UnescapeMountField(const std::string& field) {
    std::string out;
    out.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() &&
            field[i + 1] >= '0' && field[i + 1] <= '7' &&
            field[i + 2] >= '0' && field[i + 2] <= '7' &&
            field[i + 3] >= '0' && field[i + 3] <= '7') {
            int value = (field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8 + (field[i + 3] - '0');
            out += static_cast<char>(value);
            i += 3;
        } else {
            out += field[i];
        }
    }
    return out;
}

static bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// === MountEnumerator ===

MountEnumerator::MountEnumerator(RemovableMediaPredicate predicate, const std::string& mount_table)
    : predicate_(predicate), mount_table_(mount_table) {
}

std::vector<MountEntry> MountEnumerator::ReadMountTable(const std::string& mount_table) {
    std::vector<MountEntry> entries;
    std::ifstream file(mount_table);
    if (!file.is_open()) {
        return entries;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::istringstream iss(line);
        MountEntry entry;
        if (!(iss >> entry.device >> entry.mount_point >> entry.fs_type)) {
            continue;
        }
        entry.device = UnescapeMountField(entry.device);
        entry.mount_point = UnescapeMountField(entry.mount_point);
        entries.push_back(entry);
    }
    return entries;
}

bool MountEnumerator::DefaultRemovablePredicate(const MountEntry& entry) {
    static const std::set<std::string> removable_fs = {"vfat", "exfat", "ntfs", "ntfs3", "fuseblk", "msdos"};
    bool removable_path = StartsWith(entry.mount_point, "/media/") ||
                          StartsWith(entry.mount_point, "/run/media/") ||
                          StartsWith(entry.mount_point, "/mnt/");
    return removable_path && removable_fs.count(entry.fs_type) > 0;
}

std::vector<DeviceRecord> MountEnumerator::Enumerate() {
    std::vector<DeviceRecord> records;
    for (const auto& entry : ReadMountTable(mount_table_)) {
        if (!predicate_ || !predicate_(entry)) {
            continue;
        }

        DeviceRecord record;
        record.id = entry.mount_point;
        size_t slash = entry.mount_point.find_last_of('/');
        record.display_name = (slash == std::string::npos) ? entry.mount_point : entry.mount_point.substr(slash + 1);
        record.kind = DeviceKind::RemovableDrive;

        struct statvfs vfs;
        if (statvfs(entry.mount_point.c_str(), &vfs) == 0) {
            record.capacity_bytes = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
            record.free_bytes = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
        }
        records.push_back(record);
    }
    return records;
}

// === DeviceMonitor ===

DeviceMonitor::DeviceMonitor(LogCallback log_callback)
    : log_callback_(log_callback), running_(false) {
}

DeviceMonitor::~DeviceMonitor() {
    Stop();
}

void DeviceMonitor::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_(message);
    }
}

void DeviceMonitor::AddEnumerator(std::unique_ptr<DeviceEnumerator> enumerator) {
    std::lock_guard<std::mutex> lock(enumerators_mutex_);
    enumerators_.push_back(std::move(enumerator));
}

void DeviceMonitor::PollOnce(const DeviceAddedCallback& on_added, const DeviceRemovedCallback& on_removed) {
    std::map<std::string, DeviceRecord> current;
    {
        std::lock_guard<std::mutex> lock(enumerators_mutex_);
        for (auto& enumerator : enumerators_) {
            try {
                for (const auto& record : enumerator->Enumerate()) {
                    current[record.id] = record;
                }
            } catch (const std::exception& e) {
                Log("Error enumerating devices: " + std::string(e.what()));
            }
        }
    }

    std::vector<DeviceRecord> added;
    std::vector<std::string> removed;
    {
        std::lock_guard<std::mutex> lock(devices_mutex_);
        for (const auto& kv : current) {
            if (devices_.find(kv.first) == devices_.end()) {
                added.push_back(kv.second);
            }
        }
        for (const auto& kv : devices_) {
            if (current.find(kv.first) == current.end()) {
                removed.push_back(kv.first);
            }
        }
        devices_ = current;
    }

    // Callbacks run outside the lock so they may call GetDevices()
    for (const auto& record : added) {
        Log("Device connected: " + record.display_name + " (" + DeviceKindToString(record.kind) + ")");
        if (on_added) on_added(record);
    }
    for (const auto& id : removed) {
        Log("Device removed: " + id);
        if (on_removed) on_removed(id);
    }
}

void DeviceMonitor::PollLoop(DeviceAddedCallback on_added, DeviceRemovedCallback on_removed,
                             std::chrono::milliseconds interval) {
    while (running_) {
        PollOnce(on_added, on_removed);

        auto waited = std::chrono::milliseconds(0);
        while (running_ && waited < interval) {
            std::this_thread::sleep_for(POLL_SLICE);
            waited += POLL_SLICE;
        }
    }
}

void DeviceMonitor::StartBackground(DeviceAddedCallback on_added, DeviceRemovedCallback on_removed,
                                    std::chrono::milliseconds interval) {
    if (running_) {
        Log("Device monitor already running");
        return;
    }
    running_ = true;
    poll_thread_ = std::thread(&DeviceMonitor::PollLoop, this, on_added, on_removed, interval);
}

void DeviceMonitor::Stop() {
    if (!running_ && !poll_thread_.joinable()) {
        return;
    }
    running_ = false;
    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }
}

std::vector<DeviceRecord> DeviceMonitor::GetDevices() const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    std::vector<DeviceRecord> result;
    for (const auto& kv : devices_) {
        result.push_back(kv.second);
    }
    return result;
}

} // namespace offload
