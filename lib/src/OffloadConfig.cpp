#include "OffloadConfig.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace offload {

std::string OffloadConfig::EffectiveLogDir() const {
    if (!log_dir.empty()) {
        return log_dir;
    }
    const char* home = std::getenv("HOME");
    std::string base = (home && *home) ? home : ".";
    return base + "/Documents/MediaOffloadLogs";
}

std::string OffloadConfig::EffectiveTempDir() const {
    if (!temp_dir.empty()) {
        return temp_dir;
    }
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    return ec ? "/tmp" : tmp.string();
}

template<typename T>
static void ReadKey(const nlohmann::json& j, const char* key, T& field) {
    if (j.contains(key) && !j[key].is_null()) {
        field = j[key].get<T>();
    }
}

bool ConfigLoader::Load(const std::string& path, OffloadConfig& config, LogCallback log_callback) {
    if (!std::filesystem::exists(path)) {
        return false;
    }

    try {
        std::ifstream f(path);
        nlohmann::json j;
        f >> j;

        // Parse into a copy so a bad value leaves the caller's config unchanged
        OffloadConfig parsed = config;
        ReadKey(j, "log_dir", parsed.log_dir);
        ReadKey(j, "max_log_files", parsed.max_log_files);
        ReadKey(j, "hash_chunk_bytes", parsed.hash_chunk_bytes);
        ReadKey(j, "duplicate_time_tolerance_seconds", parsed.duplicate_time_tolerance_seconds);
        ReadKey(j, "copy_buffer_bytes", parsed.copy_buffer_bytes);
        ReadKey(j, "collision_attempt_limit", parsed.collision_attempt_limit);
        ReadKey(j, "transfer_wait_seconds", parsed.transfer_wait_seconds);
        ReadKey(j, "transfer_poll_ms", parsed.transfer_poll_ms);
        ReadKey(j, "temp_dir", parsed.temp_dir);
        ReadKey(j, "scan_cache_seconds", parsed.scan_cache_seconds);
        ReadKey(j, "device_poll_ms", parsed.device_poll_ms);

        if (parsed.hash_chunk_bytes == 0 || parsed.copy_buffer_bytes == 0 || parsed.collision_attempt_limit < 1) {
            throw std::invalid_argument("buffer sizes and collision_attempt_limit must be positive");
        }
        config = parsed;
        return true;
    } catch (const std::exception& e) {
        if (log_callback) {
            log_callback("[ConfigLoader] Error reading " + path + ": " + std::string(e.what()));
        }
    }
    return false;
}

bool ConfigLoader::Save(const std::string& path, const OffloadConfig& config, LogCallback log_callback) {
    nlohmann::json j;
    j["log_dir"] = config.log_dir;
    j["max_log_files"] = config.max_log_files;
    j["hash_chunk_bytes"] = config.hash_chunk_bytes;
    j["duplicate_time_tolerance_seconds"] = config.duplicate_time_tolerance_seconds;
    j["copy_buffer_bytes"] = config.copy_buffer_bytes;
    j["collision_attempt_limit"] = config.collision_attempt_limit;
    j["transfer_wait_seconds"] = config.transfer_wait_seconds;
    j["transfer_poll_ms"] = config.transfer_poll_ms;
    j["temp_dir"] = config.temp_dir;
    j["scan_cache_seconds"] = config.scan_cache_seconds;
    j["device_poll_ms"] = config.device_poll_ms;

    std::ofstream f(path);
    if (!f.is_open()) {
        if (log_callback) {
            log_callback("[ConfigLoader] Error writing " + path);
        }
        return false;
    }
    f << j.dump(4);
    return static_cast<bool>(f);
}

} // namespace offload
