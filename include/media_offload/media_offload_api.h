#ifndef MEDIA_OFFLOAD_API_H
#define MEDIA_OFFLOAD_API_H

#ifdef __cplusplus
extern "C" {
#endif

#if defined(_WIN32)
    #ifdef MEDIA_OFFLOAD_EXPORTS
        #define MEDIA_OFFLOAD_API __declspec(dllexport)
    #else
        #define MEDIA_OFFLOAD_API __declspec(dllimport)
    #endif
#else
    #define MEDIA_OFFLOAD_API __attribute__((visibility("default")))
#endif

#include <stdbool.h>
#include <stdint.h>
#include <stddef.h>

// Opaque handle to an OffloadSession
typedef void* media_offload_handle_t;

// Callback types. All except log may be invoked from a worker thread.
typedef void (*media_offload_log_callback_t)(const char* message);
typedef void (*media_offload_scan_complete_callback_t)(const char* device_id, bool success, uint32_t file_count);
typedef void (*media_offload_progress_callback_t)(uint32_t processed, uint32_t total, uint32_t copied, uint32_t skipped);
typedef void (*media_offload_file_callback_t)(const char* name);
typedef void (*media_offload_completed_callback_t)(uint32_t copied, uint32_t skipped, const char* representative_folder);
typedef void (*media_offload_interrupted_callback_t)(const char* reason, uint32_t copied, uint32_t total);
typedef void (*media_offload_fatal_callback_t)(const char* message);
typedef void (*media_offload_device_added_callback_t)(const char* device_id, const char* display_name, int kind);
typedef void (*media_offload_device_removed_callback_t)(const char* device_id);

// Device kinds
#define MEDIA_OFFLOAD_DEVICE_REMOVABLE 0
#define MEDIA_OFFLOAD_DEVICE_MTP       1
#define MEDIA_OFFLOAD_DEVICE_MANUAL    2

// Backup states returned by media_offload_run_backup / media_offload_get_last_backup
#define MEDIA_OFFLOAD_STATE_IDLE        0
#define MEDIA_OFFLOAD_STATE_PREPARING   1
#define MEDIA_OFFLOAD_STATE_COPYING     2
#define MEDIA_OFFLOAD_STATE_COMPLETED   3
#define MEDIA_OFFLOAD_STATE_INTERRUPTED 4
#define MEDIA_OFFLOAD_STATE_FATAL       5

struct MediaOffloadFileInfo {
    const char* name;
    const char* source_path;
    uint32_t object_handle;     // 0 for filesystem sources
    uint64_t size_bytes;
    int category;               // 0=photo, 1=raw, 2=video, 3=camera
    int year;
    int month;
    int day;
};

struct MediaOffloadSummary {
    uint32_t photos;
    uint32_t raw_files;
    uint32_t videos;
    uint32_t total_files;
    uint64_t total_size_bytes;
};

struct MediaOffloadBackupResult {
    int state;
    uint32_t total;
    uint32_t processed;
    uint32_t copied;
    uint32_t skipped;
    uint32_t failed;
    const char* representative_folder;  // Owned by the handle, valid until the next backup call
    const char* error;                  // Owned by the handle, empty when none
};

struct MediaOffloadValidation {
    uint32_t total_checked;
    uint32_t successful;
    uint32_t missing;
    uint32_t size_mismatch;
    uint32_t failed;
};

// Lifecycle. config_path may be NULL for defaults; returns NULL if the file cannot be loaded.
MEDIA_OFFLOAD_API media_offload_handle_t media_offload_create(const char* config_path);
MEDIA_OFFLOAD_API void media_offload_destroy(media_offload_handle_t handle);

// Logging
MEDIA_OFFLOAD_API void media_offload_set_log_callback(media_offload_handle_t handle, media_offload_log_callback_t callback);
MEDIA_OFFLOAD_API bool media_offload_open_log_file(media_offload_handle_t handle);
MEDIA_OFFLOAD_API const char* media_offload_get_log_file_path(media_offload_handle_t handle);

// Device monitoring
MEDIA_OFFLOAD_API void media_offload_start_device_monitor(
    media_offload_handle_t handle,
    media_offload_device_added_callback_t on_added,
    media_offload_device_removed_callback_t on_removed,
    bool include_mtp
);
MEDIA_OFFLOAD_API void media_offload_stop_device_monitor(media_offload_handle_t handle);

// Scanning. Synchronous calls return the inventory size, or -1 on failure.
MEDIA_OFFLOAD_API int media_offload_scan_path(media_offload_handle_t handle, const char* path);
MEDIA_OFFLOAD_API int media_offload_scan_mtp(media_offload_handle_t handle, const char* serial);
MEDIA_OFFLOAD_API bool media_offload_start_scan_path(
    media_offload_handle_t handle,
    const char* path,
    media_offload_scan_complete_callback_t on_complete
);
MEDIA_OFFLOAD_API void media_offload_stop_scan(media_offload_handle_t handle);
MEDIA_OFFLOAD_API MediaOffloadSummary media_offload_get_summary(media_offload_handle_t handle);
MEDIA_OFFLOAD_API MediaOffloadFileInfo* media_offload_get_inventory(media_offload_handle_t handle, uint32_t* count);
MEDIA_OFFLOAD_API void media_offload_free_inventory(MediaOffloadFileInfo* array, uint32_t count);

// Backup of the last inventory
MEDIA_OFFLOAD_API void media_offload_set_backup_callbacks(
    media_offload_handle_t handle,
    media_offload_progress_callback_t on_progress,
    media_offload_file_callback_t on_file_copying,
    media_offload_file_callback_t on_file_skipped,
    media_offload_completed_callback_t on_completed,
    media_offload_interrupted_callback_t on_interrupted,
    media_offload_fatal_callback_t on_fatal
);
MEDIA_OFFLOAD_API MediaOffloadBackupResult media_offload_run_backup(media_offload_handle_t handle, const char* destination_root);
MEDIA_OFFLOAD_API bool media_offload_start_backup(media_offload_handle_t handle, const char* destination_root);
MEDIA_OFFLOAD_API void media_offload_stop_backup(media_offload_handle_t handle);
MEDIA_OFFLOAD_API void media_offload_wait_backup(media_offload_handle_t handle);
MEDIA_OFFLOAD_API bool media_offload_is_backup_running(media_offload_handle_t handle);
MEDIA_OFFLOAD_API MediaOffloadBackupResult media_offload_get_last_backup(media_offload_handle_t handle);

// Validation. report_path may be NULL to skip writing the report file.
MEDIA_OFFLOAD_API MediaOffloadValidation media_offload_validate(
    media_offload_handle_t handle,
    const char* destination_root,
    const char* report_path
);

#ifdef __cplusplus
}
#endif

#endif // MEDIA_OFFLOAD_API_H
