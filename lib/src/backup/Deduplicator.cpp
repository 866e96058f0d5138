#include "Deduplicator.h"

#include <cstdlib>
#include <filesystem>
#include <sys/stat.h>

#include "FileHasher.h"
#include "../media/MediaClassifier.h"

namespace fs = std::filesystem;

namespace offload {

Deduplicator::Deduplicator(const OffloadConfig& config, LogCallback log_callback)
    : config_(config), log_callback_(log_callback) {
}

void Deduplicator::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_(message);
    }
}

std::string Deduplicator::ExpectedPath(const MediaFile& file, const std::string& destination_root) {
    return (fs::path(destination_root) / MediaClassifier::DestinationRelativePath(file)).string();
}

bool Deduplicator::CompareContent(const MediaFile& file, const std::string& candidate_path) {
    if (!fs::exists(candidate_path)) {
        return false;
    }
    if (fs::file_size(candidate_path) != file.size_bytes) {
        return false;
    }

    if (file.source.mode == AddressingMode::Filesystem) {
        // Size on disk may have changed since the scan
        if (fs::file_size(file.source.path) != file.size_bytes) {
            return false;
        }
        std::string source_hash = HashFileContents(file.source.path, config_.hash_chunk_bytes);
        std::string dest_hash = HashFileContents(candidate_path, config_.hash_chunk_bytes);
        return !source_hash.empty() && source_hash == dest_hash;
    }

    struct stat st;
    if (stat(candidate_path.c_str(), &st) != 0) {
        return false;
    }
    long long delta = static_cast<long long>(st.st_mtime) - static_cast<long long>(file.capture_date.ToTimeT());
    return std::llabs(delta) < config_.duplicate_time_tolerance_seconds;
}

bool Deduplicator::SameContent(const MediaFile& file, const std::string& candidate_path) {
    try {
        return CompareContent(file, candidate_path);
    } catch (const std::exception& e) {
        Log("Warning: Duplicate check failed for " + file.name + ": " + std::string(e.what()));
        return false;
    }
}

bool Deduplicator::IsDuplicate(const MediaFile& file, const std::string& destination_root) {
    if (file.category == MediaCategory::Unsupported || file.category == MediaCategory::CameraUnclassified) {
        return false;
    }
    try {
        return CompareContent(file, ExpectedPath(file, destination_root));
    } catch (const std::exception& e) {
        Log("Warning: Duplicate check failed for " + file.name + ": " + std::string(e.what()));
        return false;
    }
}

PartitionResult Deduplicator::Partition(const std::vector<MediaFile>& inventory, const std::string& destination_root) {
    PartitionResult result;
    for (const auto& file : inventory) {
        if (IsDuplicate(file, destination_root)) {
            result.duplicates.push_back(file);
        } else {
            result.new_files.push_back(file);
        }
    }
    Log("Duplicate check: " + std::to_string(result.new_files.size()) + " new, " +
        std::to_string(result.duplicates.size()) + " already backed up");
    return result;
}

} // namespace offload
