#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "OffloadConfig.h"
#include "OffloadTypes.h"
#include "SessionLog.h"
#include "backup/BackupValidator.h"
#include "backup/BackupWorker.h"
#include "backup/CopyEngine.h"
#include "device/DeviceMonitor.h"
#include "device/SourceDevice.h"
#include "scan/ScanWorker.h"
#include "scan/Scanner.h"

namespace offload {

/**
 * OffloadSession
 *
 * Host-facing object that owns one configuration and every worker built
 * on it: device monitor, scanner, copy engine, validator and the session log.
 * Hosts create one per application run; there is no global state.
 *
 * Typical flow:
 *   OpenDevice(record) -> StartScan(device) -> StartBackup(dest) -> Validate(dest)
 */
class OffloadSession {
public:
    explicit OffloadSession(const OffloadConfig& config = OffloadConfig());
    ~OffloadSession();

    OffloadSession(const OffloadSession&) = delete;
    OffloadSession& operator=(const OffloadSession&) = delete;

    // --- Logging / configuration ---
    void SetLogCallback(LogCallback callback);
    bool OpenLogFile();
    std::string LogFilePath() const { return session_log_.FilePath(); }

    const OffloadConfig& Config() const { return config_; }
    // Refused while a scan or backup is running
    bool LoadConfig(const std::string& path);

    // --- Devices ---
    void StartDeviceMonitor(DeviceMonitor::DeviceAddedCallback on_added,
                            DeviceMonitor::DeviceRemovedCallback on_removed,
                            RemovableMediaPredicate predicate = MountEnumerator::DefaultRemovablePredicate,
                            bool include_mtp = true);
    void StopDeviceMonitor();
    std::vector<DeviceRecord> GetDevices() const;

    // Filesystem device for drives and manual paths, connected MtpDevice for protocol devices
    std::shared_ptr<SourceDevice> OpenDevice(const DeviceRecord& record);

    // --- Scan ---
    void SetScanProgressCallback(Scanner::ProgressCallback callback);
    ScanResult Scan(std::shared_ptr<SourceDevice> device);
    void StartScan(std::shared_ptr<SourceDevice> device,
                   ScanWorker::CompletionCallback on_complete, bool use_cache = true);
    void StopScan();
    void WaitForScan();
    std::vector<MediaFile> Inventory() const;
    ScanSummary InventorySummary() const;

    // --- Backup ---
    void SetBackupObserver(BackupObserver observer);
    BackupReport Backup(const std::string& destination_root);
    bool StartBackup(const std::string& destination_root, BackupWorker::FinishedCallback on_finished = nullptr);
    void StopBackup();
    void WaitForBackup();
    bool IsBackupRunning() const { return backup_worker_.IsRunning(); }
    BackupReport LastBackupReport() const { return backup_worker_.LastReport(); }

    // --- Validation ---
    // Uses the paths the last backup into this destination wrote, when there was one
    ValidationResult Validate(const std::string& destination_root);
    std::string WriteValidationReport(const std::string& destination_root, const std::string& output_path);

private:
    OffloadConfig config_;
    SessionLog session_log_;
    LogCallback host_log_callback_;
    mutable std::mutex log_mutex_;

    DeviceMonitor device_monitor_;
    bool monitor_configured_ = false;
    Scanner scanner_;
    ScanWorker scan_worker_;
    CopyEngine copy_engine_;
    BackupWorker backup_worker_;
    BackupValidator validator_;

    mutable std::mutex state_mutex_;
    std::shared_ptr<SourceDevice> current_device_;
    std::vector<MediaFile> inventory_;

    void StoreInventory(std::shared_ptr<SourceDevice> device, const ScanResult& result);
    void Log(const std::string& message);
};

} // namespace offload
