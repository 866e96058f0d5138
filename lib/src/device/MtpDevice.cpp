#include "MtpDevice.h"

#include <fstream>
#include <map>
#include <mtp/ptp/IObjectStream.h>

using namespace mtp;

namespace offload {

// ObjectCompressedSize is 32-bit; larger objects report this and need the ObjectSize property
constexpr uint32_t MTP_SIZE_OVERFLOW = 0xFFFFFFFF;

// --- Stream helper for whole-object downloads ---
class FileObjectOutputStream : public mtp::IObjectOutputStream {
private:
    std::ofstream& _file;
public:
    FileObjectOutputStream(std::ofstream& file) : _file(file) {}
    size_t Write(const mtp::u8 *data, size_t size) override {
        if (data && size > 0) {
            _file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
            if (!_file) {
                throw std::runtime_error("write to destination file failed");
            }
        }
        return size;
    }
    void Cancel() override {}
};

// --- Open session registry ---

static std::mutex open_sessions_mutex;
static std::map<std::string, std::pair<DeviceRecord, int>> open_sessions;

void OpenMtpSessions::Add(const DeviceRecord& record) {
    std::lock_guard<std::mutex> lock(open_sessions_mutex);
    auto& entry = open_sessions[record.id];
    entry.first = record;
    entry.second++;
}

void OpenMtpSessions::Remove(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(open_sessions_mutex);
    auto it = open_sessions.find(device_id);
    if (it != open_sessions.end() && --it->second.second <= 0) {
        open_sessions.erase(it);
    }
}

std::vector<DeviceRecord> OpenMtpSessions::Records() {
    std::lock_guard<std::mutex> lock(open_sessions_mutex);
    std::vector<DeviceRecord> records;
    for (const auto& kv : open_sessions) {
        records.push_back(kv.second.first);
    }
    return records;
}

MtpDevice::MtpDevice(LogCallback log_callback)
    : log_callback_(log_callback) {
}

MtpDevice::~MtpDevice() {
    Disconnect();
}

void MtpDevice::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_(message);
    }
}

bool MtpDevice::Connect(const std::string& serial_filter) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    try {
        Log("Connecting to MTP device via USB...");
        usb_context_ = std::make_shared<usb::Context>();

        for (auto desc : usb_context_->GetDevices()) {
            try {
                auto candidate = Device::Open(usb_context_, desc, true, false);
                if (!candidate) continue;

                auto info = candidate->GetInfo();
                if (!serial_filter.empty() && info.SerialNumber != serial_filter) {
                    continue;
                }
                device_ = candidate;
                serial_number_ = info.SerialNumber;
                model_ = info.Model;
                manufacturer_ = info.Manufacturer;
                break;
            } catch (const std::exception& e) {
                Log("Failed to open device: " + std::string(e.what()));
            }
        }

        if (!device_) {
            Log("Error: No MTP device found on USB");
            return false;
        }
        Log("  ✓ Device found: " + manufacturer_ + " " + model_);

        Log("Opening MTP session...");
        mtp_session_ = device_->OpenSession(1);
        if (!mtp_session_) {
            Log("Error: Failed to open MTP session");
            device_.reset();
            return false;
        }
        Log("  ✓ Session opened");

        if (!registered_) {
            DeviceRecord record;
            record.id = Id();
            record.display_name = DisplayName();
            record.kind = DeviceKind::PortableProtocolDevice;
            OpenMtpSessions::Add(record);
            registered_ = true;
        }
        return true;
    } catch (const std::exception& e) {
        Log("Error connecting to MTP device: " + std::string(e.what()));
        mtp_session_.reset();
        device_.reset();
        return false;
    }
}

void MtpDevice::Disconnect() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (registered_) {
        OpenMtpSessions::Remove(Id());
        registered_ = false;
    }
    storage_folders_.clear();
    mtp_session_.reset();
    device_.reset();
    usb_context_.reset();
}

bool MtpDevice::IsConnected() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return mtp_session_ != nullptr;
}

std::string MtpDevice::Id() const {
    return "MTP:" + (serial_number_.empty() ? model_ : serial_number_);
}

std::string MtpDevice::DisplayName() const {
    if (manufacturer_.empty()) return model_;
    return manufacturer_ + " " + model_;
}

bool MtpDevice::IsReachable() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (!mtp_session_) {
        return false;
    }
    try {
        // Any round trip shows the session is alive; storage IDs are cheap
        mtp_session_->GetStorageIDs();
        return true;
    } catch (const std::exception& e) {
        Log("MTP device not reachable: " + std::string(e.what()));
        return false;
    }
}

ProtocolItem MtpDevice::MakeItem(mtp::ObjectId handle) {
    auto info = mtp_session_->GetObjectInfo(handle);

    ProtocolItem item;
    item.handle = handle.Id;
    item.name = info.Filename;
    item.is_folder = info.ObjectFormat == ObjectFormat::Association;
    item.size = info.ObjectCompressedSize;
    item.capture_date = info.CaptureDate;
    item.modification_date = info.ModificationDate;

    if (!item.is_folder) {
        if (info.ObjectCompressedSize == MTP_SIZE_OVERFLOW) {
            item.size = mtp_session_->GetObjectIntegerProperty(handle, mtp::ObjectProperty::ObjectSize);
        }
        try {
            item.file_name_property = mtp_session_->GetObjectStringProperty(handle, mtp::ObjectProperty::ObjectFilename);
        } catch (const std::exception&) {
            // Property not supported by every device; the listed name is used instead
            item.file_name_property.clear();
        }
    }
    return item;
}

std::string MtpDevice::StorageFolderName(const std::string& description, const std::string& volume_label,
                                         size_t index) {
    std::string name = !description.empty() ? description : volume_label;
    if (name.empty()) {
        name = "Storage " + std::to_string(index + 1);
    }
    // The name becomes one segment of the source path
    for (auto& c : name) {
        if (c == '/' || c == '\\') c = '_';
    }
    if (name == "." || name == "..") {
        name = "Storage " + std::to_string(index + 1);
    }
    return name;
}

std::vector<ProtocolItem> MtpDevice::ListChildren(uint32_t parent_handle) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (!mtp_session_) {
        throw std::runtime_error("device not found: MTP session is not open");
    }

    std::vector<ProtocolItem> results;
    if (parent_handle == ROOT_HANDLE) {
        storage_folders_.clear();
        auto storageIds = mtp_session_->GetStorageIDs();
        size_t index = 0;
        for (auto storageId : storageIds.StorageIDs) {
            if (index >= MAX_STORAGE_FOLDERS) {
                Log("Warning: Device reports more than " + std::to_string(MAX_STORAGE_FOLDERS) +
                    " storages; the rest are not scanned");
                break;
            }
            auto info = mtp_session_->GetStorageInfo(storageId);
            ProtocolItem item;
            item.handle = STORAGE_FOLDER_BASE + static_cast<uint32_t>(index);
            item.name = StorageFolderName(info.StorageDescription, info.VolumeLabel, index);
            item.is_folder = true;
            storage_folders_.emplace(item.handle, storageId);
            results.push_back(item);
            index++;
        }
        return results;
    }

    auto storage = storage_folders_.find(parent_handle);
    if (storage != storage_folders_.end()) {
        auto handles = mtp_session_->GetObjectHandles(storage->second, mtp::ObjectFormat::Any, mtp::Session::Root);
        for (auto handle : handles.ObjectHandles) {
            results.push_back(MakeItem(handle));
        }
        return results;
    }

    auto handles = mtp_session_->GetObjectHandles(mtp::Session::AllStorages, mtp::ObjectFormat::Any, mtp::ObjectId(parent_handle));
    for (auto handle : handles.ObjectHandles) {
        results.push_back(MakeItem(handle));
    }
    return results;
}

bool MtpDevice::DownloadObject(uint32_t handle, const std::string& destination_path) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (!mtp_session_) {
        Log("Error: Not connected to a device.");
        return false;
    }
    try {
        std::ofstream file(destination_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            Log("Error: Could not open file for writing: " + destination_path);
            return false;
        }
        auto stream = std::make_shared<FileObjectOutputStream>(file);
        mtp_session_->GetObject(mtp::ObjectId(handle), stream);
        file.close();
        return !file.fail();
    } catch (const std::exception& e) {
        Log("Error downloading object: " + std::string(e.what()));
        return false;
    }
}

size_t MtpDevice::ReadObjectChunk(uint32_t handle, uint64_t offset, size_t size, std::vector<uint8_t>& out) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (!mtp_session_) {
        throw std::runtime_error("device not found: MTP session is not open");
    }
    mtp::ByteArray data = mtp_session_->GetPartialObject(mtp::ObjectId(handle), offset, static_cast<mtp::u32>(size));
    out.insert(out.end(), data.begin(), data.end());
    return data.size();
}

DeviceRecord MtpDevice::Record() {
    DeviceRecord record;
    record.id = Id();
    record.display_name = DisplayName();
    record.kind = DeviceKind::PortableProtocolDevice;

    std::lock_guard<std::mutex> lock(session_mutex_);
    if (!mtp_session_) {
        return record;
    }
    try {
        auto storageIds = mtp_session_->GetStorageIDs();
        for (auto storageId : storageIds.StorageIDs) {
            auto info = mtp_session_->GetStorageInfo(storageId);
            record.capacity_bytes += info.MaxCapacity;
            record.free_bytes += info.FreeSpaceInBytes;
        }
    } catch (const std::exception& e) {
        Log("Warning: Could not read storage info: " + std::string(e.what()));
    }
    return record;
}

// === MtpEnumerator ===

MtpEnumerator::MtpEnumerator(LogCallback log_callback)
    : log_callback_(log_callback) {
}

std::vector<DeviceRecord> MtpEnumerator::Enumerate() {
    // A second USB context must not run PTP transactions beside an open session
    std::vector<DeviceRecord> records = OpenMtpSessions::Records();
    if (!records.empty()) {
        return records;
    }
    try {
        mtp::usb::ContextPtr ctx = std::make_shared<mtp::usb::Context>();
        for (auto desc : ctx->GetDevices()) {
            try {
                // No interface claim: a session may already be open elsewhere
                auto device = mtp::Device::Open(ctx, desc, false, false);
                if (!device) continue;

                auto info = device->GetInfo();
                DeviceRecord record;
                record.id = "MTP:" + (info.SerialNumber.empty() ? info.Model : info.SerialNumber);
                record.display_name = info.Manufacturer.empty() ? info.Model : info.Manufacturer + " " + info.Model;
                record.kind = DeviceKind::PortableProtocolDevice;
                records.push_back(record);
            } catch (const std::exception&) {
                // Non-MTP USB devices fail to open; they are simply not sources
                continue;
            }
        }
    } catch (const std::exception& e) {
        if (log_callback_) {
            log_callback_("Error enumerating USB devices: " + std::string(e.what()));
        }
    }
    return records;
}

} // namespace offload
