#pragma once

#include <string>
#include <vector>

#include "../OffloadConfig.h"
#include "../OffloadTypes.h"

namespace offload {

struct PartitionResult {
    std::vector<MediaFile> new_files;
    std::vector<MediaFile> duplicates;
};

/**
 * Deduplicator
 *
 * Decides whether a source file already exists at its computed destination.
 *
 * Rules, in order:
 * - camera files whose type is still unresolved are always new
 * - nothing at the expected path: new
 * - sizes differ: new
 * - filesystem source: duplicate when the BLAKE3 content hashes match
 * - protocol source: duplicate when the destination mtime is within the
 *   configured tolerance of the capture time (a full download would be
 *   needed to hash it)
 *
 * A comparison that throws counts as "not a duplicate" so the file is copied
 * again rather than dropped.
 */
class Deduplicator {
public:
    Deduplicator(const OffloadConfig& config, LogCallback log_callback = nullptr);

    bool IsDuplicate(const MediaFile& file, const std::string& destination_root);

    // Same-content test against an arbitrary existing path (used for collisions)
    bool SameContent(const MediaFile& file, const std::string& candidate_path);

    // Order of both lists follows the inventory
    PartitionResult Partition(const std::vector<MediaFile>& inventory, const std::string& destination_root);

    static std::string ExpectedPath(const MediaFile& file, const std::string& destination_root);

private:
    const OffloadConfig& config_;
    LogCallback log_callback_;

    bool CompareContent(const MediaFile& file, const std::string& candidate_path);
    void Log(const std::string& message);
};

} // namespace offload
