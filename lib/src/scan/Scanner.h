#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "../OffloadTypes.h"
#include "../device/SourceDevice.h"
#include "../media/MetadataReader.h"

namespace offload {

struct ScanSummary {
    size_t photos = 0;          // Photo + camera files
    size_t raw_files = 0;
    size_t videos = 0;
    size_t total_files = 0;
    uint64_t total_size_bytes = 0;
};

struct ScanResult {
    bool success = false;
    bool cancelled = false;
    std::string error;                   // Set when the whole scan failed
    std::vector<MediaFile> files;        // Inventory, in discovery order
    ScanSummary summary;
    std::vector<std::string> skipped;    // One message per entry that could not be classified
};

/**
 * Scanner
 *
 * Walks a source device and produces the inventory of classified media files.
 *
 * Filesystem devices are walked recursively; protocol devices are listed
 * folder by folder through ListChildren. Entries that fail individually are
 * recorded in ScanResult::skipped and the walk continues. The scan fails as
 * a whole only when the device is unreachable or its root cannot be listed.
 *
 * Capture date priority: embedded metadata, date in the path, device
 * reported date, file modification time, scan time.
 */
class Scanner {
public:
    using ProgressCallback = std::function<void(size_t files_found, uint64_t bytes_seen)>;

    explicit Scanner(LogCallback log_callback = nullptr);

    void SetProgressCallback(ProgressCallback callback) { progress_callback_ = callback; }

    // cancel is polled once per entry; a cancelled scan returns what it has with cancelled=true
    ScanResult Scan(SourceDevice& device, const std::atomic<bool>* cancel = nullptr);

    ScanResult ScanFilesystem(FilesystemDevice& device, const std::atomic<bool>* cancel = nullptr);
    ScanResult ScanProtocol(ProtocolDevice& device, const std::atomic<bool>* cancel = nullptr);

    static ScanSummary Summarize(const std::vector<MediaFile>& files);

private:
    LogCallback log_callback_;
    ProgressCallback progress_callback_;
    MetadataReader metadata_reader_;

    struct WalkState {
        ScanResult* result;
        const std::atomic<bool>* cancel;
        uint64_t bytes_seen = 0;
    };

    void WalkProtocolFolder(ProtocolDevice& device, uint32_t handle, const std::string& folder_path,
                            int depth, WalkState& state);
    bool AddProtocolItem(ProtocolDevice& device, const ProtocolItem& item, const std::string& folder_path,
                         WalkState& state);
    void ResolveCameraFile(MediaFile& file, const std::vector<uint8_t>& header);

    void RecordSkip(WalkState& state, const std::string& message);
    void ReportProgress(WalkState& state, const MediaFile& file);
    bool IsCancelled(const WalkState& state) const;
    void Log(const std::string& message);
};

} // namespace offload
