#include "OffloadSession.h"

#include <filesystem>

#include "device/MtpDevice.h"

namespace fs = std::filesystem;

namespace offload {

static const char* const MTP_ID_PREFIX = "MTP:";

OffloadSession::OffloadSession(const OffloadConfig& config)
    : config_(config),
      device_monitor_([this](const std::string& msg) { this->Log(msg); }),
      scanner_([this](const std::string& msg) { this->Log(msg); }),
      scan_worker_(scanner_, std::chrono::seconds(config.scan_cache_seconds),
                   [this](const std::string& msg) { this->Log(msg); }),
      copy_engine_(config_, [this](const std::string& msg) { this->Log(msg); }),
      backup_worker_(copy_engine_, [this](const std::string& msg) { this->Log(msg); }),
      validator_([this](const std::string& msg) { this->Log(msg); }) {
}

OffloadSession::~OffloadSession() {
    // Workers call back into this object; stop them before members go away
    StopDeviceMonitor();
    StopScan();
    StopBackup();
    WaitForBackup();
    session_log_.Close();
}

// --- Logging / configuration ---

void OffloadSession::Log(const std::string& message) {
    session_log_.Write(SessionLog::LevelFromMessage(message), message);

    LogCallback host;
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        host = host_log_callback_;
    }
    if (host) {
        host(message);
    }
}

void OffloadSession::SetLogCallback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    host_log_callback_ = callback;
}

bool OffloadSession::OpenLogFile() {
    if (!session_log_.Open(config_.EffectiveLogDir(), config_.max_log_files)) {
        return false;
    }
    Log("Session log: " + session_log_.FilePath());
    return true;
}

bool OffloadSession::LoadConfig(const std::string& path) {
    if (scan_worker_.IsRunning() || backup_worker_.IsRunning()) {
        Log("Error: Cannot change configuration while a scan or backup is running");
        return false;
    }
    if (!ConfigLoader::Load(path, config_, [this](const std::string& msg) { this->Log(msg); })) {
        return false;
    }
    scan_worker_.SetCacheTimeout(std::chrono::seconds(config_.scan_cache_seconds));
    Log("Loaded configuration from " + path);
    return true;
}

// --- Devices ---

void OffloadSession::StartDeviceMonitor(DeviceMonitor::DeviceAddedCallback on_added,
                                        DeviceMonitor::DeviceRemovedCallback on_removed,
                                        RemovableMediaPredicate predicate, bool include_mtp) {
    if (device_monitor_.IsRunning()) {
        return;
    }
    // Enumerators are registered once; a restarted monitor reuses them
    if (!monitor_configured_) {
        auto log = [this](const std::string& msg) { this->Log(msg); };
        device_monitor_.AddEnumerator(std::make_unique<MountEnumerator>(predicate));
        if (include_mtp) {
            device_monitor_.AddEnumerator(std::make_unique<MtpEnumerator>(log));
        }
        monitor_configured_ = true;
    }
    device_monitor_.StartBackground(on_added, on_removed, std::chrono::milliseconds(config_.device_poll_ms));
}

void OffloadSession::StopDeviceMonitor() {
    device_monitor_.Stop();
}

std::vector<DeviceRecord> OffloadSession::GetDevices() const {
    return device_monitor_.GetDevices();
}

std::shared_ptr<SourceDevice> OffloadSession::OpenDevice(const DeviceRecord& record) {
    if (record.kind != DeviceKind::PortableProtocolDevice) {
        auto device = std::make_shared<FilesystemDevice>(record.id, record.display_name);
        if (!device->IsReachable()) {
            Log("Error: Source path not accessible: " + record.id);
            return nullptr;
        }
        return device;
    }

    std::string serial = record.id;
    if (serial.compare(0, std::string(MTP_ID_PREFIX).size(), MTP_ID_PREFIX) == 0) {
        serial = serial.substr(std::string(MTP_ID_PREFIX).size());
    }
    auto device = std::make_shared<MtpDevice>([this](const std::string& msg) { this->Log(msg); });
    if (!device->Connect(serial)) {
        return nullptr;
    }
    return device;
}

// --- Scan ---

void OffloadSession::SetScanProgressCallback(Scanner::ProgressCallback callback) {
    scanner_.SetProgressCallback(callback);
}

void OffloadSession::StoreInventory(std::shared_ptr<SourceDevice> device, const ScanResult& result) {
    if (!result.success) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    current_device_ = device;
    inventory_ = result.files;
}

ScanResult OffloadSession::Scan(std::shared_ptr<SourceDevice> device) {
    if (!device) {
        ScanResult result;
        result.error = "No device";
        return result;
    }
    scan_worker_.Stop();
    ScanResult result = scanner_.Scan(*device);
    StoreInventory(device, result);
    return result;
}

void OffloadSession::StartScan(std::shared_ptr<SourceDevice> device, ScanWorker::CompletionCallback on_complete,
                               bool use_cache) {
    if (!device) {
        Log("Error: No device to scan");
        return;
    }
    scan_worker_.Start(device, [this, device, on_complete](const std::string& device_id, const ScanResult& result) {
        StoreInventory(device, result);
        if (on_complete) {
            on_complete(device_id, result);
        }
    }, use_cache);
}

void OffloadSession::StopScan() {
    scan_worker_.Stop();
}

void OffloadSession::WaitForScan() {
    scan_worker_.Wait();
}

std::vector<MediaFile> OffloadSession::Inventory() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return inventory_;
}

ScanSummary OffloadSession::InventorySummary() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return Scanner::Summarize(inventory_);
}

// --- Backup ---

void OffloadSession::SetBackupObserver(BackupObserver observer) {
    copy_engine_.SetObserver(observer);
}

BackupReport OffloadSession::Backup(const std::string& destination_root) {
    std::shared_ptr<SourceDevice> device;
    std::vector<MediaFile> files;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        device = current_device_;
        files = inventory_;
    }
    if (!device) {
        BackupReport report;
        report.state = BackupState::Fatal;
        report.error = "No scanned source device";
        Log("Error: " + report.error);
        return report;
    }
    return backup_worker_.RunNow(*device, files, destination_root);
}

bool OffloadSession::StartBackup(const std::string& destination_root, BackupWorker::FinishedCallback on_finished) {
    std::shared_ptr<SourceDevice> device;
    std::vector<MediaFile> files;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        device = current_device_;
        files = inventory_;
    }
    if (!device) {
        Log("Error: No scanned source device");
        return false;
    }
    return backup_worker_.Start(device, std::move(files), destination_root, on_finished);
}

void OffloadSession::StopBackup() {
    backup_worker_.Stop();
}

void OffloadSession::WaitForBackup() {
    backup_worker_.Wait();
}

// --- Validation ---

static bool SameDirectory(const std::string& a, const std::string& b) {
    std::error_code ec_a, ec_b;
    fs::path canonical_a = fs::weakly_canonical(a, ec_a);
    fs::path canonical_b = fs::weakly_canonical(b, ec_b);
    if (ec_a || ec_b) {
        return fs::path(a).lexically_normal() == fs::path(b).lexically_normal();
    }
    return canonical_a == canonical_b;
}

ValidationResult OffloadSession::Validate(const std::string& destination_root) {
    std::vector<MediaFile> files = Inventory();
    BackupReport last = backup_worker_.LastReport();
    if (last.state != BackupState::Idle && !backup_worker_.IsRunning() &&
        SameDirectory(last.destination_root, destination_root)) {
        return validator_.Validate(files, last.results, destination_root);
    }
    return validator_.Validate(files, destination_root);
}

std::string OffloadSession::WriteValidationReport(const std::string& destination_root, const std::string& output_path) {
    return validator_.GenerateReport(Validate(destination_root), output_path);
}

} // namespace offload
