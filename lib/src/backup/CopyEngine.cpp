#include "CopyEngine.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>
#include <tuple>

#include "FileOps.h"
#include "../media/MediaClassifier.h"

namespace fs = std::filesystem;

namespace offload {

// Lowercased fragments of errors that mean a drive or device went away
static const char* const DISCONNECTION_SIGNATURES[] = {
    "device not ready",
    "device is not ready",
    "drive not ready",
    "the system cannot find the path",
    "no such file or directory",
    "access is denied",
    "permission denied",
    "the network path was not found",
    "the specified path is invalid",
    "device not found",
    "no such device",
    "input/output error",
    "transport endpoint is not connected",
};

constexpr size_t SNIFF_HEADER_BYTES = 16;

CopyEngine::CopyEngine(const OffloadConfig& config, LogCallback log_callback)
    : config_(config), log_callback_(log_callback), deduplicator_(config, log_callback),
      stop_requested_(false), state_(BackupState::Idle) {
}

void CopyEngine::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_(message);
    }
}

bool CopyEngine::IsDisconnectionError(const std::string& message) {
    std::string lower = message;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char* signature : DISCONNECTION_SIGNATURES) {
        if (lower.find(signature) != std::string::npos) {
            return true;
        }
    }
    return false;
}

InterruptReason CopyEngine::DetermineDisconnectedSide(SourceDevice& source, const std::string& destination_root) {
    if (!source.IsReachable()) {
        return InterruptReason::SourceDisconnected;
    }
    if (!IsDirectoryAccessible(destination_root, true)) {
        return InterruptReason::DestinationDisconnected;
    }
    return InterruptReason::ConnectionAnomaly;
}

std::string CopyEngine::RepresentativeFolder(const std::vector<FileResult>& results, const std::string& destination_root) {
    // (year, month, day) and file count per subfolder
    struct FolderStats {
        std::tuple<int, int, int> date;
        size_t count = 0;
    };

    auto collect = [&](CopyStatus status) {
        std::map<std::string, FolderStats> folders;
        for (const auto& r : results) {
            if (r.outcome.status != status || r.file.category == MediaCategory::Unsupported) continue;
            const auto& d = r.file.capture_date;
            auto& stats = folders[MediaClassifier::DestinationSubfolder(r.file.category, d)];
            stats.date = std::make_tuple(d.year, d.month, d.day);
            stats.count++;
        }
        return folders;
    };

    auto folders = collect(CopyStatus::Copied);
    if (folders.empty()) {
        folders = collect(CopyStatus::SkippedDuplicate);
    }
    if (folders.empty()) {
        return destination_root;
    }

    auto best = folders.begin();
    for (auto it = folders.begin(); it != folders.end(); ++it) {
        if (std::tie(it->second.date, it->second.count) > std::tie(best->second.date, best->second.count)) {
            best = it;
        }
    }
    return (fs::path(destination_root) / best->first).string();
}

void CopyEngine::EmitProgress(const BackupReport& report) {
    if (observer_.on_progress) {
        ProgressUpdate update;
        update.processed = report.processed;
        update.total = report.total;
        update.copied = report.copied;
        update.skipped = report.skipped;
        observer_.on_progress(update);
    }
}

void CopyEngine::Finish(BackupReport& report, BackupState state) {
    report.state = state;
    state_ = state;

    switch (state) {
        case BackupState::Completed:
            report.representative_folder = RepresentativeFolder(report.results, report.representative_folder);
            Log("Backup completed: " + std::to_string(report.copied) + " copied, " +
                std::to_string(report.skipped) + " skipped, " + std::to_string(report.failed) + " failed");
            if (observer_.on_completed) {
                observer_.on_completed(report.copied, report.skipped, report.representative_folder);
            }
            break;
        case BackupState::Interrupted:
            Log("Warning: Backup interrupted: " + InterruptReasonToString(report.interrupt_reason) + " after " +
                std::to_string(report.copied) + " of " + std::to_string(report.total) + " files");
            if (observer_.on_interrupted) {
                observer_.on_interrupted(report.interrupt_reason, report.copied, report.total);
            }
            break;
        case BackupState::Fatal:
            Log("Error: Backup failed: " + report.error);
            if (observer_.on_fatal) {
                observer_.on_fatal(report.error);
            }
            break;
        default:
            break;
    }
}

BackupReport CopyEngine::Run(SourceDevice& source, const std::vector<MediaFile>& files, const std::string& destination_root) {
    BackupReport report;
    report.destination_root = destination_root;
    // Holds the root until Finish() replaces it with the chosen subfolder
    report.representative_folder = destination_root;
    state_ = BackupState::Preparing;

    try {
        Log("Starting backup of " + std::to_string(files.size()) + " files from " +
            source.DisplayName() + " to " + destination_root);

        std::error_code ec;
        fs::create_directories(destination_root, ec);
        if (!IsDirectoryAccessible(destination_root, true)) {
            throw std::runtime_error("Destination not accessible: " + destination_root +
                                     (ec ? " (" + ec.message() + ")" : ""));
        }

        if (source.Mode() == AddressingMode::Protocol) {
            auto* protocol = dynamic_cast<ProtocolDevice*>(&source);
            if (!protocol) {
                throw std::logic_error("Protocol-mode source does not implement ProtocolDevice");
            }
            active_chain_ = custom_chain_.empty()
                ? MakeProtocolTransferChain(*protocol, config_, log_callback_)
                : custom_chain_;
        }

        PartitionResult partition = deduplicator_.Partition(files, destination_root);
        report.total = files.size();

        // Duplicates first, for cumulative progress only
        for (const auto& dup : partition.duplicates) {
            report.results.push_back({dup, CopyOutcome::Skipped(Deduplicator::ExpectedPath(dup, destination_root))});
            report.skipped++;
            report.processed++;
            if (observer_.on_file_skipped) observer_.on_file_skipped(dup.name);
            EmitProgress(report);
        }

        if (partition.new_files.empty()) {
            Log("No new files to copy");
            Finish(report, BackupState::Completed);
            return report;
        }

        state_ = BackupState::Copying;
        for (const auto& input : partition.new_files) {
            if (stop_requested_) {
                Log("Backup stopped by user after " + std::to_string(report.processed) + " files");
                break;
            }

            if (!source.IsReachable()) {
                report.interrupt_reason = InterruptReason::SourceDisconnected;
            } else if (!IsDirectoryAccessible(destination_root, true)) {
                report.interrupt_reason = InterruptReason::DestinationDisconnected;
            }
            if (report.interrupt_reason != InterruptReason::None) {
                report.error = InterruptReasonToString(report.interrupt_reason);
                Finish(report, BackupState::Interrupted);
                return report;
            }

            MediaFile file = input;
            if (observer_.on_file_copying) observer_.on_file_copying(file.name);

            CopyOutcome outcome;
            try {
                outcome = CopyOne(source, file, destination_root);
            } catch (const std::exception& e) {
                std::string message = e.what();
                bool source_gone = file.source.mode == AddressingMode::Protocol && !source.IsReachable();
                if (source_gone || IsDisconnectionError(message)) {
                    report.interrupt_reason = DetermineDisconnectedSide(source, destination_root);
                    report.error = InterruptReasonToString(report.interrupt_reason) + ": " + message;
                    Log("Error copying " + file.name + ": " + message);
                    Finish(report, BackupState::Interrupted);
                    return report;
                }
                outcome = CopyOutcome::Failed(ErrorKind::CopyFailed, message);
            }

            switch (outcome.status) {
                case CopyStatus::Copied:
                    report.copied++;
                    break;
                case CopyStatus::SkippedDuplicate:
                    report.skipped++;
                    if (observer_.on_file_skipped) observer_.on_file_skipped(file.name);
                    break;
                case CopyStatus::Failed:
                    report.failed++;
                    Log("Error: Failed to copy " + file.name + " [" + ErrorKindToString(outcome.error) + "]: " + outcome.reason);
                    break;
            }
            report.results.push_back({file, outcome});
            report.processed++;
            EmitProgress(report);
        }

        Finish(report, BackupState::Completed);
    } catch (const std::exception& e) {
        BackupReport fatal;
        fatal.destination_root = destination_root;
        fatal.total = files.size();
        fatal.error = e.what();
        Finish(fatal, BackupState::Fatal);
        return fatal;
    }
    return report;
}

void CopyEngine::ResolveCameraFile(SourceDevice& source, MediaFile& file) {
    std::vector<uint8_t> header;
    if (file.source.mode == AddressingMode::Filesystem) {
        std::ifstream in(file.source.path, std::ios::binary);
        if (!in.is_open()) return;
        header.resize(SNIFF_HEADER_BYTES);
        in.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
        header.resize(static_cast<size_t>(in.gcount()));
    } else if (auto* protocol = dynamic_cast<ProtocolDevice*>(&source)) {
        protocol->ReadObjectChunk(file.source.object_handle, 0, SNIFF_HEADER_BYTES, header);
    }

    SniffResult sniff = MediaClassifier::SniffCategory(header.data(), header.size());
    if (sniff.category == MediaCategory::CameraUnclassified) {
        Log("  Could not identify " + file.name + ", filing under Photos");
        return;
    }
    file.category = sniff.category;
    if (MediaClassifier::Extension(file.name).empty()) {
        file.name += sniff.extension;
    }
}

bool CopyEngine::ResolveCollision(const MediaFile& file, const std::string& dest_dir, std::string& dest_path,
                                  CopyOutcome& early_outcome) {
    if (!fs::exists(dest_path)) {
        return true;
    }
    if (deduplicator_.SameContent(file, dest_path)) {
        Log("  Identical file already at " + dest_path);
        early_outcome = CopyOutcome::Skipped(dest_path);
        return false;
    }

    std::string ext = MediaClassifier::Extension(file.name).empty() ? "" : file.name.substr(file.name.find_last_of('.'));
    std::string base = file.name.substr(0, file.name.size() - ext.size());

    for (int n = 1; n <= config_.collision_attempt_limit; ++n) {
        std::string candidate = (fs::path(dest_dir) / (base + "_" + std::to_string(n) + ext)).string();
        if (!fs::exists(candidate)) {
            Log("  Name in use, writing " + file.name + " as " + fs::path(candidate).filename().string());
            dest_path = candidate;
            return true;
        }
        if (deduplicator_.SameContent(file, candidate)) {
            early_outcome = CopyOutcome::Skipped(candidate);
            return false;
        }
    }

    early_outcome = CopyOutcome::Failed(ErrorKind::FilenameCollisionExhausted,
                                        "Cannot generate unique filename for " + file.name + " after " +
                                        std::to_string(config_.collision_attempt_limit) + " attempts");
    return false;
}

void CopyEngine::TransferBytes(SourceDevice& source, const MediaFile& file, const std::string& dest_path) {
    if (file.source.mode == AddressingMode::Filesystem) {
        StreamCopyFile(file.source.path, dest_path, config_.copy_buffer_bytes);
        CopyFileAttributes(file.source.path, dest_path);
        return;
    }

    if (!dynamic_cast<ProtocolDevice*>(&source)) {
        throw std::logic_error("Protocol file " + file.name + " given with a non-protocol source");
    }
    TransferRunner runner(active_chain_, config_, log_callback_);
    std::string method = runner.Run(file.source, dest_path);
    Log("  Transferred " + file.name + " via " + method);

    // The capture time becomes the mtime so the next run recognizes the copy
    SetModificationTime(dest_path, file.capture_date.ToTimeT());
}

CopyOutcome CopyEngine::CopyOne(SourceDevice& source, MediaFile& file, const std::string& destination_root) {
    if (!MediaClassifier::IsPlainFileName(file.name)) {
        return CopyOutcome::Failed(ErrorKind::ClassificationSkip, "Unusable file name \"" + file.name + "\"");
    }
    if (file.category == MediaCategory::CameraUnclassified) {
        ResolveCameraFile(source, file);
    }

    std::string dest_dir = (fs::path(destination_root) /
                            MediaClassifier::DestinationSubfolder(file.category, file.capture_date)).string();
    fs::create_directories(dest_dir);

    std::string dest_path = (fs::path(dest_dir) / file.name).string();
    CopyOutcome early_outcome;
    if (!ResolveCollision(file, dest_dir, dest_path, early_outcome)) {
        return early_outcome;
    }

    Log("Copying " + file.source.path + " -> " + dest_path);
    try {
        TransferBytes(source, file, dest_path);
    } catch (const std::exception&) {
        if (!RemoveFileIfExists(dest_path)) {
            Log("Warning: Could not remove partial file " + dest_path);
        }
        throw;
    }

    uint64_t written = fs::file_size(dest_path);
    if (written != file.size_bytes) {
        if (!RemoveFileIfExists(dest_path)) {
            Log("Warning: Could not remove mismatched file " + dest_path);
        }
        return CopyOutcome::Failed(ErrorKind::CopyVerificationMismatch,
                                   "Size mismatch: expected " + std::to_string(file.size_bytes) +
                                   " bytes, got " + std::to_string(written));
    }
    return CopyOutcome::Copied(dest_path);
}

} // namespace offload
