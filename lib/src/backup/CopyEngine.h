#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "../OffloadConfig.h"
#include "../OffloadTypes.h"
#include "../device/SourceDevice.h"
#include "Deduplicator.h"
#include "TransferStrategy.h"

namespace offload {

/**
 * BackupState
 *
 * Idle -> Preparing -> Copying -> Completed
 *                  \           \-> Interrupted (a device became unreachable)
 *                   \-------------> Fatal (failure outside the per-file loop)
 *
 * Preparing goes straight to Completed when every file is a duplicate.
 */
enum class BackupState : uint8_t {
    Idle = 0,
    Preparing = 1,
    Copying = 2,
    Completed = 3,
    Interrupted = 4,
    Fatal = 5,
};

inline std::string BackupStateToString(BackupState state) {
    switch (state) {
        case BackupState::Idle:        return "Idle";
        case BackupState::Preparing:   return "Preparing";
        case BackupState::Copying:     return "Copying";
        case BackupState::Completed:   return "Completed";
        case BackupState::Interrupted: return "Interrupted";
        case BackupState::Fatal:       return "Fatal";
        default:                       return "Unknown";
    }
}

enum class InterruptReason : uint8_t {
    None = 0,
    SourceDisconnected = 1,
    DestinationDisconnected = 2,
    ConnectionAnomaly = 3,       // Disconnect-like error but both sides still answer
};

inline std::string InterruptReasonToString(InterruptReason reason) {
    switch (reason) {
        case InterruptReason::None:                    return "None";
        case InterruptReason::SourceDisconnected:      return "Source device disconnected";
        case InterruptReason::DestinationDisconnected: return "Destination drive disconnected";
        case InterruptReason::ConnectionAnomaly:       return "Drive connection anomaly";
        default:                                       return "Unknown";
    }
}

struct ProgressUpdate {
    size_t processed = 0;
    size_t total = 0;
    size_t copied = 0;
    size_t skipped = 0;
};

// Notifications, delivered synchronously on the thread running the engine
struct BackupObserver {
    std::function<void(const ProgressUpdate&)> on_progress;
    std::function<void(const std::string& name)> on_file_copying;
    std::function<void(const std::string& name)> on_file_skipped;
    std::function<void(size_t copied, size_t skipped, const std::string& representative_folder)> on_completed;
    std::function<void(InterruptReason reason, size_t copied, size_t total)> on_interrupted;
    std::function<void(const std::string& message)> on_fatal;
};

struct FileResult {
    MediaFile file;
    CopyOutcome outcome;
};

struct BackupReport {
    BackupState state = BackupState::Idle;
    InterruptReason interrupt_reason = InterruptReason::None;
    size_t total = 0;          // New + duplicate files
    size_t processed = 0;
    size_t copied = 0;
    size_t skipped = 0;
    size_t failed = 0;
    std::string destination_root;
    std::string representative_folder;
    std::string error;         // Fatal message or interruption detail
    std::vector<FileResult> results;
};

/**
 * CopyEngine
 *
 * Runs one backup session: partitions the inventory, reports duplicates,
 * then copies new files into {Type}_{YYYY}/{MM}/{DD} under the destination.
 *
 * Per file: stop flag, reachability of both sides, directory creation,
 * collision handling (identical content is skipped, different content gets
 * a _N suffix), streaming copy or protocol transfer chain, size check.
 * Per-file failures are tallied and the loop continues; a disconnection
 * ends the session as Interrupted with the counts so far.
 *
 * Not reentrant: one Run() at a time per engine.
 */
class CopyEngine {
public:
    CopyEngine(const OffloadConfig& config, LogCallback log_callback = nullptr);

    void SetObserver(BackupObserver observer) { observer_ = observer; }

    // Replace the default protocol chain (NativeDownload, StreamRead, TempFileRoundTrip)
    void SetProtocolTransferChain(TransferChain chain) { custom_chain_ = chain; }

    BackupReport Run(SourceDevice& source, const std::vector<MediaFile>& files, const std::string& destination_root);

    // Honored between files; a transfer in progress always finishes.
    // The request stays set until ClearStop(), so it also covers a Run() that has not started yet.
    void RequestStop() { stop_requested_ = true; }
    void ClearStop() { stop_requested_ = false; }

    BackupState State() const { return state_; }

    static bool IsDisconnectionError(const std::string& message);

    // Subfolder with the most recent date, ties broken by file count; root if nothing qualifies
    static std::string RepresentativeFolder(const std::vector<FileResult>& results, const std::string& destination_root);

private:
    const OffloadConfig& config_;
    LogCallback log_callback_;
    BackupObserver observer_;
    Deduplicator deduplicator_;
    TransferChain custom_chain_;
    TransferChain active_chain_;
    std::atomic<bool> stop_requested_;
    std::atomic<BackupState> state_;

    CopyOutcome CopyOne(SourceDevice& source, MediaFile& file, const std::string& destination_root);
    void ResolveCameraFile(SourceDevice& source, MediaFile& file);
    bool ResolveCollision(const MediaFile& file, const std::string& dest_dir, std::string& dest_path,
                          CopyOutcome& early_outcome);
    void TransferBytes(SourceDevice& source, const MediaFile& file, const std::string& dest_path);
    InterruptReason DetermineDisconnectedSide(SourceDevice& source, const std::string& destination_root);

    void EmitProgress(const BackupReport& report);
    void Finish(BackupReport& report, BackupState state);
    void Log(const std::string& message);
};

} // namespace offload
