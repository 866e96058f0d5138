#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "Scanner.h"

namespace offload {

/**
 * ScanWorker
 *
 * Runs one scan at a time on a background thread. Starting a new scan
 * cancels and joins the one in flight; a superseded scan never reports
 * completion. Finished inventories are cached per device id for a limited
 * time so re-selecting a device does not rescan it.
 *
 * Callbacks run on the worker thread and must not call Start() or Stop().
 */
class ScanWorker {
public:
    using CompletionCallback = std::function<void(const std::string& device_id, const ScanResult& result)>;

    ScanWorker(Scanner& scanner, std::chrono::seconds cache_timeout, LogCallback log_callback = nullptr);
    ~ScanWorker();

    // The device is shared with the worker thread until the scan finishes
    void Start(std::shared_ptr<SourceDevice> device, CompletionCallback on_complete, bool use_cache = true);

    // Cancel the scan in flight and wait for the thread
    void Stop();

    // Block until the current scan finishes
    void Wait();

    bool IsRunning() const { return running_; }
    std::string CurrentDeviceId() const;

    bool GetCached(const std::string& device_id, ScanResult& result) const;
    void ClearCache(const std::string& device_id = "");

    // Applies to entries already cached as well as new ones
    void SetCacheTimeout(std::chrono::seconds cache_timeout);

private:
    struct CacheEntry {
        ScanResult result;
        std::chrono::steady_clock::time_point stored_at;
    };

    Scanner& scanner_;
    std::chrono::seconds cache_timeout_;
    LogCallback log_callback_;

    std::atomic<bool> running_;
    std::atomic<bool> cancel_;
    std::thread scan_thread_;
    std::string current_device_id_;
    mutable std::mutex state_mutex_;
    std::map<std::string, CacheEntry> cache_;

    void Run(std::shared_ptr<SourceDevice> device, CompletionCallback on_complete);
    void Log(const std::string& message);
};

} // namespace offload
