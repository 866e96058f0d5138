#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "CopyEngine.h"

namespace offload {

/**
 * Runs CopyEngine sessions one at a time, on a background thread or on the
 * caller's thread. Both paths share one guard, so a second session is
 * refused while any session is running.
 * Notifications go through the engine's observer on the running thread.
 *
 * The finished callback runs on the worker thread and must not call Wait().
 */
class BackupWorker {
public:
    using FinishedCallback = std::function<void(const BackupReport& report)>;

    BackupWorker(CopyEngine& engine, LogCallback log_callback = nullptr);
    ~BackupWorker();

    // Returns false if a backup is already running
    bool Start(std::shared_ptr<SourceDevice> source, std::vector<MediaFile> files,
               const std::string& destination_root, FinishedCallback on_finished = nullptr);

    // Runs on the calling thread; a Fatal report if a backup is already running
    BackupReport RunNow(SourceDevice& source, const std::vector<MediaFile>& files,
                        const std::string& destination_root);

    // Cooperative: the current file finishes first
    void Stop();

    void Wait();

    bool IsRunning() const { return running_; }

    // Report of the last finished session, background or synchronous
    BackupReport LastReport() const;

private:
    CopyEngine& engine_;
    LogCallback log_callback_;
    std::atomic<bool> running_;
    std::mutex start_mutex_;
    std::thread backup_thread_;
    mutable std::mutex report_mutex_;
    BackupReport last_report_;

    bool TryClaim();
    void Release(const BackupReport& report);
    void Run(std::shared_ptr<SourceDevice> source, std::vector<MediaFile> files,
             std::string destination_root, FinishedCallback on_finished);
    void Log(const std::string& message);
};

} // namespace offload
