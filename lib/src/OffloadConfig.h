#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "OffloadTypes.h"

namespace offload {

/**
 * Session-scoped settings. One instance is owned by the OffloadSession and
 * passed by reference to the scanner, deduplicator and copy engine; nothing
 * reads configuration from global state.
 */
struct OffloadConfig {
    // --- Logging ---
    std::string log_dir;                         // Empty: $HOME/Documents/MediaOffloadLogs
    int max_log_files = 20;

    // --- Deduplication ---
    size_t hash_chunk_bytes = 8192;
    int duplicate_time_tolerance_seconds = 2;    // Protocol sources: |dest mtime - capture time|

    // --- Copy ---
    size_t copy_buffer_bytes = 1024 * 1024;
    int collision_attempt_limit = 1000;
    int transfer_wait_seconds = 10;              // Per protocol fallback
    int transfer_poll_ms = 200;
    std::string temp_dir;                        // Empty: system temp directory

    // --- Scan / devices ---
    int scan_cache_seconds = 300;
    int device_poll_ms = 1000;

    // Resolved log directory (applies the default when log_dir is empty)
    std::string EffectiveLogDir() const;
    std::string EffectiveTempDir() const;
};

class ConfigLoader {
public:
    /**
     * Override fields of config with the keys present in a settings.json file.
     * Unknown keys are ignored. On a parse error config is left untouched.
     *
     * @return true if the file was read, false if it is missing or malformed
     */
    static bool Load(const std::string& path, OffloadConfig& config, LogCallback log_callback = nullptr);

    // Write every field of config to path (pretty-printed)
    static bool Save(const std::string& path, const OffloadConfig& config, LogCallback log_callback = nullptr);
};

} // namespace offload
