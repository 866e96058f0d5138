#include "Scanner.h"

#include <filesystem>
#include <fstream>
#include <sys/stat.h>

#include "../media/MediaClassifier.h"

namespace fs = std::filesystem;

namespace offload {

// Bytes read from a camera file to identify its real type
constexpr size_t SNIFF_HEADER_BYTES = 16;

// Protocol listings can loop on broken devices
constexpr int MAX_FOLDER_DEPTH = 32;

Scanner::Scanner(LogCallback log_callback)
    : log_callback_(log_callback), metadata_reader_(log_callback) {
}

void Scanner::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_(message);
    }
}

bool Scanner::IsCancelled(const WalkState& state) const {
    return state.cancel && state.cancel->load();
}

void Scanner::RecordSkip(WalkState& state, const std::string& message) {
    Log("Warning: Skipped " + message);
    state.result->skipped.push_back(message);
}

void Scanner::ReportProgress(WalkState& state, const MediaFile& file) {
    state.bytes_seen += file.size_bytes;
    if (progress_callback_) {
        progress_callback_(state.result->files.size(), state.bytes_seen);
    }
}

ScanSummary Scanner::Summarize(const std::vector<MediaFile>& files) {
    ScanSummary summary;
    for (const auto& file : files) {
        switch (file.category) {
            case MediaCategory::Photo:
            case MediaCategory::CameraUnclassified:
                summary.photos++;
                break;
            case MediaCategory::Raw:
                summary.raw_files++;
                break;
            case MediaCategory::Video:
                summary.videos++;
                break;
            default:
                break;
        }
        summary.total_size_bytes += file.size_bytes;
    }
    summary.total_files = files.size();
    return summary;
}

void Scanner::ResolveCameraFile(MediaFile& file, const std::vector<uint8_t>& header) {
    SniffResult sniff = MediaClassifier::SniffCategory(header.data(), header.size());
    if (sniff.category == MediaCategory::CameraUnclassified) {
        return;
    }
    file.category = sniff.category;
    if (MediaClassifier::Extension(file.name).empty()) {
        file.name += sniff.extension;
    }
    Log("  Resolved camera file " + file.original_name + " -> " + file.name +
        " (" + MediaCategoryToString(file.category) + ")");
}

ScanResult Scanner::Scan(SourceDevice& device, const std::atomic<bool>* cancel) {
    if (device.Mode() == AddressingMode::Protocol) {
        if (auto* protocol = dynamic_cast<ProtocolDevice*>(&device)) {
            return ScanProtocol(*protocol, cancel);
        }
    } else if (auto* filesystem = dynamic_cast<FilesystemDevice*>(&device)) {
        return ScanFilesystem(*filesystem, cancel);
    }

    ScanResult result;
    result.error = "Unsupported device type: " + device.Id();
    Log("Error: " + result.error);
    return result;
}

// === Filesystem mode ===

static bool ReadHeader(const std::string& path, std::vector<uint8_t>& header) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    header.resize(SNIFF_HEADER_BYTES);
    file.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
    header.resize(static_cast<size_t>(file.gcount()));
    return true;
}

ScanResult Scanner::ScanFilesystem(FilesystemDevice& device, const std::atomic<bool>* cancel) {
    ScanResult result;
    WalkState state{&result, cancel};
    const std::string& root = device.RootPath();

    if (!device.IsReachable()) {
        result.error = "Source not accessible: " + root;
        Log("Error: " + result.error);
        return result;
    }

    Log("Scanning " + root + "...");

    // Directories still to list, depth-first in discovery order
    std::vector<fs::path> pending = {fs::path(root)};
    bool at_root = true;

    while (!pending.empty()) {
        if (IsCancelled(state)) break;

        fs::path dir = pending.back();
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            if (at_root) {
                result.error = "Cannot list " + root + ": " + ec.message();
                Log("Error: " + result.error);
                return result;
            }
            RecordSkip(state, dir.string() + ": " + ec.message());
            continue;
        }
        at_root = false;

        std::vector<fs::path> subdirs;
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                RecordSkip(state, dir.string() + ": " + ec.message());
                break;
            }
            if (IsCancelled(state)) break;

            const fs::path path = it->path();
            try {
                if (it->is_symlink()) continue;
                if (it->is_directory()) {
                    subdirs.push_back(path);
                    continue;
                }
                if (!it->is_regular_file()) continue;

                MediaFile file;
                file.name = path.filename().string();
                file.original_name = file.name;
                file.category = MediaClassifier::Classify(file.name);
                if (file.category == MediaCategory::Unsupported) continue;

                file.source.mode = AddressingMode::Filesystem;
                file.source.path = path.string();
                file.size_bytes = fs::file_size(path);

                if (file.category == MediaCategory::CameraUnclassified) {
                    std::vector<uint8_t> header;
                    if (ReadHeader(file.source.path, header)) {
                        ResolveCameraFile(file, header);
                    }
                }

                std::string relative = path.lexically_relative(root).string();
                if (auto date = metadata_reader_.ReadCaptureDate(file.source.path, file.category)) {
                    file.capture_date = *date;
                } else if (auto path_date = ParsePathDate(relative)) {
                    file.capture_date = *path_date;
                } else {
                    struct stat st;
                    if (stat(file.source.path.c_str(), &st) == 0) {
                        file.capture_date = CaptureDate::FromTimeT(st.st_mtime, DateSource::FILE_MODIFIED);
                    } else {
                        file.capture_date = CaptureDate::Now();
                    }
                }

                result.files.push_back(file);
                ReportProgress(state, file);
            } catch (const std::exception& e) {
                RecordSkip(state, path.string() + ": " + std::string(e.what()));
            }
        }

        // Reverse so the first subdirectory is listed next
        pending.insert(pending.end(), subdirs.rbegin(), subdirs.rend());
    }

    result.cancelled = IsCancelled(state);
    result.summary = Summarize(result.files);
    result.success = true;
    Log("Scan " + std::string(result.cancelled ? "cancelled" : "complete") + ": " +
        std::to_string(result.files.size()) + " media files, " +
        std::to_string(result.skipped.size()) + " skipped");
    return result;
}

// === Protocol mode ===

bool Scanner::AddProtocolItem(ProtocolDevice& device, const ProtocolItem& item, const std::string& folder_path,
                              WalkState& state) {
    MediaFile file;
    file.original_name = item.name;
    file.name = MediaClassifier::RepairProtocolName(item.name, item.file_name_property);
    if (!MediaClassifier::IsPlainFileName(file.name)) {
        RecordSkip(state, folder_path + "/" + item.name + ": " + ErrorKindToString(ErrorKind::ClassificationSkip) +
                   ", unusable file name");
        return false;
    }
    file.category = MediaClassifier::Classify(file.name);
    if (file.category == MediaCategory::Unsupported) {
        return false;
    }

    file.source.mode = AddressingMode::Protocol;
    file.source.path = folder_path + "/" + file.name;
    file.source.object_handle = item.handle;
    file.size_bytes = item.size;

    if (file.category == MediaCategory::CameraUnclassified) {
        std::vector<uint8_t> header;
        device.ReadObjectChunk(item.handle, 0, SNIFF_HEADER_BYTES, header);
        ResolveCameraFile(file, header);
    }

    if (auto path_date = ParsePathDate(file.source.path)) {
        file.capture_date = *path_date;
    } else if (auto captured = ParseDeviceDate(item.capture_date)) {
        file.capture_date = *captured;
    } else if (auto modified = ParseDeviceDate(item.modification_date)) {
        file.capture_date = *modified;
    } else {
        file.capture_date = CaptureDate::Now();
    }

    state.result->files.push_back(file);
    ReportProgress(state, file);
    return true;
}

void Scanner::WalkProtocolFolder(ProtocolDevice& device, uint32_t handle, const std::string& folder_path,
                                 int depth, WalkState& state) {
    if (depth > MAX_FOLDER_DEPTH) {
        RecordSkip(state, folder_path + ": folder nesting too deep");
        return;
    }

    std::vector<ProtocolItem> children;
    try {
        children = device.ListChildren(handle);
    } catch (const std::exception& e) {
        if (handle == ProtocolDevice::ROOT_HANDLE) {
            throw;
        }
        RecordSkip(state, folder_path + ": " + std::string(e.what()));
        return;
    }

    for (const auto& item : children) {
        if (IsCancelled(state)) return;

        if (item.is_folder) {
            WalkProtocolFolder(device, item.handle, folder_path + "/" + item.name, depth + 1, state);
            continue;
        }
        try {
            AddProtocolItem(device, item, folder_path, state);
        } catch (const std::exception& e) {
            RecordSkip(state, folder_path + "/" + item.name + ": " + std::string(e.what()));
        }
    }
}

ScanResult Scanner::ScanProtocol(ProtocolDevice& device, const std::atomic<bool>* cancel) {
    ScanResult result;
    WalkState state{&result, cancel};

    if (!device.IsReachable()) {
        result.error = "Device not accessible: " + device.DisplayName();
        Log("Error: " + result.error);
        return result;
    }

    Log("Scanning device " + device.DisplayName() + "...");
    try {
        WalkProtocolFolder(device, ProtocolDevice::ROOT_HANDLE, device.DisplayName(), 0, state);
    } catch (const std::exception& e) {
        result.error = "Cannot list device " + device.DisplayName() + ": " + std::string(e.what());
        Log("Error: " + result.error);
        result.files.clear();
        return result;
    }

    result.cancelled = IsCancelled(state);
    result.summary = Summarize(result.files);
    result.success = true;
    Log("Scan " + std::string(result.cancelled ? "cancelled" : "complete") + ": " +
        std::to_string(result.files.size()) + " media files, " +
        std::to_string(result.skipped.size()) + " skipped");
    return result;
}

} // namespace offload
