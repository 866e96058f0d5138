#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <mtp/ptp/Device.h>
#include <mtp/ptp/Session.h>
#include <usb/Context.h>

#include "SourceDevice.h"
#include "DeviceMonitor.h"

namespace offload {

/**
 * MtpDevice
 *
 * ProtocolDevice over a USB MTP session (android-file-transfer-linux).
 * The root handle lists one folder per storage, named after its
 * description; each storage folder lists that storage's top-level objects.
 *
 * The scan and copy workers may use the same device one after the other,
 * so session calls are serialized internally.
 */
class MtpDevice : public ProtocolDevice {
public:
    explicit MtpDevice(LogCallback log_callback = nullptr);
    ~MtpDevice() override;

    // --- Connection Management ---
    // Opens the first MTP device whose serial matches (any device if empty)
    bool Connect(const std::string& serial_filter = "");
    void Disconnect();
    bool IsConnected() const;

    // --- SourceDevice ---
    std::string Id() const override;
    std::string DisplayName() const override;
    bool IsReachable() override;

    // --- ProtocolDevice ---
    std::vector<ProtocolItem> ListChildren(uint32_t parent_handle) override;
    bool DownloadObject(uint32_t handle, const std::string& destination_path) override;
    size_t ReadObjectChunk(uint32_t handle, uint64_t offset, size_t size, std::vector<uint8_t>& out) override;

    // Capacity summed over all storages
    DeviceRecord Record();

    // Storage folders get handles from the top of the handle range, one per storage
    static constexpr uint32_t STORAGE_FOLDER_BASE = 0xFFFFFF00;
    static constexpr uint32_t MAX_STORAGE_FOLDERS = 0xFF;

    // Folder name for a storage: description, else volume label, else "Storage <n>"
    static std::string StorageFolderName(const std::string& description, const std::string& volume_label,
                                         size_t index);

private:
    LogCallback log_callback_;
    mtp::usb::ContextPtr usb_context_;
    mtp::DevicePtr device_;
    mtp::SessionPtr mtp_session_;
    mutable std::mutex session_mutex_;
    bool registered_ = false;
    std::map<uint32_t, mtp::StorageId> storage_folders_;   // folder handle -> storage

    std::string serial_number_;
    std::string model_;
    std::string manufacturer_;

    ProtocolItem MakeItem(mtp::ObjectId handle);
    void Log(const std::string& message);
};

/**
 * Process-wide list of MTP devices that have an open session.
 * Entries are counted, so each Add needs a matching Remove.
 */
class OpenMtpSessions {
public:
    static void Add(const DeviceRecord& record);
    static void Remove(const std::string& device_id);
    static std::vector<DeviceRecord> Records();
};

/**
 * Lists MTP devices present on USB. Opening a device to read its serial does
 * not start a session.
 *
 * While any MtpDevice session is open the USB bus is left alone and the
 * open devices are reported from OpenMtpSessions. Other MTP devices are
 * listed again once the session closes.
 */
class MtpEnumerator : public DeviceEnumerator {
public:
    explicit MtpEnumerator(LogCallback log_callback = nullptr);

    std::vector<DeviceRecord> Enumerate() override;

private:
    LogCallback log_callback_;
};

} // namespace offload
