#include "media_offload/media_offload_api.h"
#include "OffloadSession.h"
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

using offload::BackupObserver;
using offload::BackupReport;
using offload::DeviceKind;
using offload::DeviceRecord;
using offload::OffloadConfig;
using offload::OffloadSession;

namespace {

// Session plus the strings handed out to C callers
struct ApiHandle {
    explicit ApiHandle(const OffloadConfig& config) : session(config) {}

    OffloadSession session;
    std::string log_file_path;
    std::string representative_folder;
    std::string error;
};

ApiHandle* ToHandle(media_offload_handle_t handle) {
    return static_cast<ApiHandle*>(handle);
}

MediaOffloadBackupResult ToBackupResult(ApiHandle* api, const BackupReport& report) {
    api->representative_folder = report.representative_folder;
    api->error = report.error;

    MediaOffloadBackupResult result{};
    result.state = static_cast<int>(report.state);
    result.total = static_cast<uint32_t>(report.total);
    result.processed = static_cast<uint32_t>(report.processed);
    result.copied = static_cast<uint32_t>(report.copied);
    result.skipped = static_cast<uint32_t>(report.skipped);
    result.failed = static_cast<uint32_t>(report.failed);
    result.representative_folder = api->representative_folder.c_str();
    result.error = api->error.c_str();
    return result;
}

int ScanDevice(ApiHandle* api, std::shared_ptr<offload::SourceDevice> device) {
    if (!device) {
        return -1;
    }
    offload::ScanResult result = api->session.Scan(device);
    if (!result.success) {
        return -1;
    }
    return static_cast<int>(result.files.size());
}

} // namespace

extern "C" {

MEDIA_OFFLOAD_API media_offload_handle_t media_offload_create(const char* config_path) {
    OffloadConfig config;
    if (config_path && *config_path) {
        if (!offload::ConfigLoader::Load(config_path, config, [](const std::string& message) {
                std::cerr << message << std::endl;
            })) {
            return nullptr;
        }
    }
    return new ApiHandle(config);
}

MEDIA_OFFLOAD_API void media_offload_destroy(media_offload_handle_t handle) {
    delete ToHandle(handle);
}

MEDIA_OFFLOAD_API void media_offload_set_log_callback(media_offload_handle_t handle, media_offload_log_callback_t callback) {
    if (!handle) return;
    if (!callback) {
        ToHandle(handle)->session.SetLogCallback(nullptr);
        return;
    }
    ToHandle(handle)->session.SetLogCallback([callback](const std::string& message) {
        callback(message.c_str());
    });
}

MEDIA_OFFLOAD_API bool media_offload_open_log_file(media_offload_handle_t handle) {
    if (handle) {
        return ToHandle(handle)->session.OpenLogFile();
    }
    return false;
}

MEDIA_OFFLOAD_API const char* media_offload_get_log_file_path(media_offload_handle_t handle) {
    if (!handle) return nullptr;
    auto* api = ToHandle(handle);
    api->log_file_path = api->session.LogFilePath();
    return api->log_file_path.c_str();
}

MEDIA_OFFLOAD_API void media_offload_start_device_monitor(
    media_offload_handle_t handle,
    media_offload_device_added_callback_t on_added,
    media_offload_device_removed_callback_t on_removed,
    bool include_mtp) {
    if (!handle) return;
    ToHandle(handle)->session.StartDeviceMonitor(
        [on_added](const DeviceRecord& record) {
            if (on_added) {
                on_added(record.id.c_str(), record.display_name.c_str(), static_cast<int>(record.kind));
            }
        },
        [on_removed](const std::string& device_id) {
            if (on_removed) {
                on_removed(device_id.c_str());
            }
        },
        offload::MountEnumerator::DefaultRemovablePredicate,
        include_mtp);
}

MEDIA_OFFLOAD_API void media_offload_stop_device_monitor(media_offload_handle_t handle) {
    if (handle) {
        ToHandle(handle)->session.StopDeviceMonitor();
    }
}

MEDIA_OFFLOAD_API int media_offload_scan_path(media_offload_handle_t handle, const char* path) {
    if (!handle || !path) return -1;
    auto* api = ToHandle(handle);
    DeviceRecord record;
    record.id = path;
    record.display_name = path;
    record.kind = DeviceKind::Manual;
    return ScanDevice(api, api->session.OpenDevice(record));
}

MEDIA_OFFLOAD_API int media_offload_scan_mtp(media_offload_handle_t handle, const char* serial) {
    if (!handle) return -1;
    auto* api = ToHandle(handle);
    DeviceRecord record;
    record.id = std::string("MTP:") + (serial ? serial : "");
    record.kind = DeviceKind::PortableProtocolDevice;
    return ScanDevice(api, api->session.OpenDevice(record));
}

MEDIA_OFFLOAD_API bool media_offload_start_scan_path(
    media_offload_handle_t handle,
    const char* path,
    media_offload_scan_complete_callback_t on_complete) {
    if (!handle || !path) return false;
    auto* api = ToHandle(handle);
    DeviceRecord record;
    record.id = path;
    record.display_name = path;
    record.kind = DeviceKind::Manual;
    auto device = api->session.OpenDevice(record);
    if (!device) {
        return false;
    }
    try {
        api->session.StartScan(device, [on_complete](const std::string& device_id, const offload::ScanResult& result) {
            if (on_complete) {
                on_complete(device_id.c_str(), result.success, static_cast<uint32_t>(result.files.size()));
            }
        });
    } catch (const std::exception& e) {
        std::cerr << "media_offload_start_scan_path: " << e.what() << std::endl;
        return false;
    }
    return true;
}

MEDIA_OFFLOAD_API void media_offload_stop_scan(media_offload_handle_t handle) {
    if (handle) {
        ToHandle(handle)->session.StopScan();
    }
}

MEDIA_OFFLOAD_API MediaOffloadSummary media_offload_get_summary(media_offload_handle_t handle) {
    MediaOffloadSummary summary{};
    if (!handle) return summary;
    offload::ScanSummary s = ToHandle(handle)->session.InventorySummary();
    summary.photos = static_cast<uint32_t>(s.photos);
    summary.raw_files = static_cast<uint32_t>(s.raw_files);
    summary.videos = static_cast<uint32_t>(s.videos);
    summary.total_files = static_cast<uint32_t>(s.total_files);
    summary.total_size_bytes = s.total_size_bytes;
    return summary;
}

MEDIA_OFFLOAD_API MediaOffloadFileInfo* media_offload_get_inventory(media_offload_handle_t handle, uint32_t* count) {
    if (!handle || !count) {
        if (count) *count = 0;
        return nullptr;
    }
    auto files = ToHandle(handle)->session.Inventory();
    *count = static_cast<uint32_t>(files.size());
    if (files.empty()) {
        return nullptr;
    }
    auto* c_files = new MediaOffloadFileInfo[files.size()];
    for (size_t i = 0; i < files.size(); ++i) {
        const auto& f = files[i];
        c_files[i].name = strdup(f.name.c_str());
        c_files[i].source_path = strdup(f.source.path.c_str());
        c_files[i].object_handle = f.source.object_handle;
        c_files[i].size_bytes = f.size_bytes;
        c_files[i].category = static_cast<int>(f.category);
        c_files[i].year = f.capture_date.year;
        c_files[i].month = f.capture_date.month;
        c_files[i].day = f.capture_date.day;
    }
    return c_files;
}

MEDIA_OFFLOAD_API void media_offload_free_inventory(MediaOffloadFileInfo* array, uint32_t count) {
    if (!array) return;
    for (uint32_t i = 0; i < count; ++i) {
        free((void*)array[i].name);
        free((void*)array[i].source_path);
    }
    delete[] array;
}

MEDIA_OFFLOAD_API void media_offload_set_backup_callbacks(
    media_offload_handle_t handle,
    media_offload_progress_callback_t on_progress,
    media_offload_file_callback_t on_file_copying,
    media_offload_file_callback_t on_file_skipped,
    media_offload_completed_callback_t on_completed,
    media_offload_interrupted_callback_t on_interrupted,
    media_offload_fatal_callback_t on_fatal) {
    if (!handle) return;

    BackupObserver observer;
    if (on_progress) {
        observer.on_progress = [on_progress](const offload::ProgressUpdate& update) {
            on_progress(static_cast<uint32_t>(update.processed), static_cast<uint32_t>(update.total),
                        static_cast<uint32_t>(update.copied), static_cast<uint32_t>(update.skipped));
        };
    }
    if (on_file_copying) {
        observer.on_file_copying = [on_file_copying](const std::string& name) { on_file_copying(name.c_str()); };
    }
    if (on_file_skipped) {
        observer.on_file_skipped = [on_file_skipped](const std::string& name) { on_file_skipped(name.c_str()); };
    }
    if (on_completed) {
        observer.on_completed = [on_completed](size_t copied, size_t skipped, const std::string& folder) {
            on_completed(static_cast<uint32_t>(copied), static_cast<uint32_t>(skipped), folder.c_str());
        };
    }
    if (on_interrupted) {
        observer.on_interrupted = [on_interrupted](offload::InterruptReason reason, size_t copied, size_t total) {
            on_interrupted(offload::InterruptReasonToString(reason).c_str(),
                           static_cast<uint32_t>(copied), static_cast<uint32_t>(total));
        };
    }
    if (on_fatal) {
        observer.on_fatal = [on_fatal](const std::string& message) { on_fatal(message.c_str()); };
    }
    ToHandle(handle)->session.SetBackupObserver(observer);
}

MEDIA_OFFLOAD_API MediaOffloadBackupResult media_offload_run_backup(media_offload_handle_t handle, const char* destination_root) {
    if (!handle || !destination_root) {
        MediaOffloadBackupResult result{};
        result.state = MEDIA_OFFLOAD_STATE_FATAL;
        return result;
    }
    auto* api = ToHandle(handle);
    return ToBackupResult(api, api->session.Backup(destination_root));
}

MEDIA_OFFLOAD_API bool media_offload_start_backup(media_offload_handle_t handle, const char* destination_root) {
    if (handle && destination_root) {
        return ToHandle(handle)->session.StartBackup(destination_root);
    }
    return false;
}

MEDIA_OFFLOAD_API void media_offload_stop_backup(media_offload_handle_t handle) {
    if (handle) {
        ToHandle(handle)->session.StopBackup();
    }
}

MEDIA_OFFLOAD_API void media_offload_wait_backup(media_offload_handle_t handle) {
    if (handle) {
        ToHandle(handle)->session.WaitForBackup();
    }
}

MEDIA_OFFLOAD_API bool media_offload_is_backup_running(media_offload_handle_t handle) {
    if (handle) {
        return ToHandle(handle)->session.IsBackupRunning();
    }
    return false;
}

MEDIA_OFFLOAD_API MediaOffloadBackupResult media_offload_get_last_backup(media_offload_handle_t handle) {
    if (!handle) {
        MediaOffloadBackupResult result{};
        return result;
    }
    auto* api = ToHandle(handle);
    return ToBackupResult(api, api->session.LastBackupReport());
}

MEDIA_OFFLOAD_API MediaOffloadValidation media_offload_validate(
    media_offload_handle_t handle,
    const char* destination_root,
    const char* report_path) {
    MediaOffloadValidation validation{};
    if (!handle || !destination_root) return validation;

    auto* api = ToHandle(handle);
    offload::ValidationResult result = api->session.Validate(destination_root);
    if (report_path && *report_path) {
        api->session.WriteValidationReport(destination_root, report_path);
    }
    validation.total_checked = static_cast<uint32_t>(result.total_checked);
    validation.successful = static_cast<uint32_t>(result.successful);
    validation.missing = static_cast<uint32_t>(result.missing);
    validation.size_mismatch = static_cast<uint32_t>(result.size_mismatch);
    validation.failed = static_cast<uint32_t>(result.failed);
    return validation;
}

} // extern "C"
