#include "BackupWorker.h"

#include <system_error>

namespace offload {

BackupWorker::BackupWorker(CopyEngine& engine, LogCallback log_callback)
    : engine_(engine), log_callback_(log_callback), running_(false) {
}

BackupWorker::~BackupWorker() {
    Stop();
    Wait();
}

void BackupWorker::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_(message);
    }
}

bool BackupWorker::TryClaim() {
    bool idle = false;
    if (!running_.compare_exchange_strong(idle, true)) {
        Log("Error: A backup is already running");
        return false;
    }
    engine_.ClearStop();
    return true;
}

void BackupWorker::Release(const BackupReport& report) {
    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        last_report_ = report;
    }
    running_ = false;
}

bool BackupWorker::Start(std::shared_ptr<SourceDevice> source, std::vector<MediaFile> files,
                         const std::string& destination_root, FinishedCallback on_finished) {
    if (!source) {
        Log("Error: No source device selected");
        return false;
    }

    std::lock_guard<std::mutex> lock(start_mutex_);
    if (!TryClaim()) {
        return false;
    }
    // Reap the previous, already finished thread
    if (backup_thread_.joinable()) {
        if (backup_thread_.get_id() == std::this_thread::get_id()) {
            // Started again from its own finished callback
            backup_thread_.detach();
        } else {
            backup_thread_.join();
        }
    }

    try {
        backup_thread_ = std::thread(&BackupWorker::Run, this, source, std::move(files), destination_root, on_finished);
    } catch (const std::system_error& e) {
        running_ = false;
        Log("Error: Could not start backup thread: " + std::string(e.what()));
        return false;
    }
    return true;
}

BackupReport BackupWorker::RunNow(SourceDevice& source, const std::vector<MediaFile>& files,
                                  const std::string& destination_root) {
    if (!TryClaim()) {
        BackupReport refused;
        refused.state = BackupState::Fatal;
        refused.error = "A backup is already running";
        return refused;
    }

    BackupReport report;
    try {
        report = engine_.Run(source, files, destination_root);
    } catch (const std::exception& e) {
        report = BackupReport();
        report.state = BackupState::Fatal;
        report.destination_root = destination_root;
        report.error = e.what();
        Log("Error: Backup failed: " + report.error);
    }
    Release(report);
    return report;
}

void BackupWorker::Run(std::shared_ptr<SourceDevice> source, std::vector<MediaFile> files,
                       std::string destination_root, FinishedCallback on_finished) {
    BackupReport report;
    try {
        report = engine_.Run(*source, files, destination_root);
    } catch (const std::exception& e) {
        report = BackupReport();
        report.state = BackupState::Fatal;
        report.destination_root = destination_root;
        report.error = e.what();
        Log("Error: Backup failed: " + report.error);
    }
    Release(report);
    if (on_finished) {
        on_finished(report);
    }
}

void BackupWorker::Stop() {
    if (running_) {
        Log("Stop requested; finishing current file");
    }
    engine_.RequestStop();
}

void BackupWorker::Wait() {
    std::lock_guard<std::mutex> lock(start_mutex_);
    if (backup_thread_.joinable() && backup_thread_.get_id() != std::this_thread::get_id()) {
        backup_thread_.join();
    }
}

BackupReport BackupWorker::LastReport() const {
    std::lock_guard<std::mutex> lock(report_mutex_);
    return last_report_;
}

} // namespace offload
