#pragma once

#include <string>
#include <vector>

#include "../OffloadTypes.h"
#include "CopyEngine.h"

namespace offload {

struct ValidationFailure {
    std::string file;    // Source path
    std::string error;
};

struct ValidationResult {
    size_t total_checked = 0;
    size_t successful = 0;
    size_t missing = 0;
    size_t size_mismatch = 0;
    size_t failed = 0;   // Any other error
    std::vector<ValidationFailure> failed_files;
};

/**
 * Post-hoc check that every inventory file exists at its computed
 * destination with the recorded size. Used after a backup, independent of
 * the copy engine's own verification.
 */
class BackupValidator {
public:
    explicit BackupValidator(LogCallback log_callback = nullptr);

    ValidationResult Validate(const std::vector<MediaFile>& files, const std::string& destination_root);

    // Checks the paths a finished session actually wrote, including renamed collisions
    ValidationResult Validate(const std::vector<FileResult>& results);

    /**
     * Inventory files the session processed are checked at the path it wrote
     * (or counted failed); files it never reached are checked at their
     * expected paths. Results are matched to files by source path.
     */
    ValidationResult Validate(const std::vector<MediaFile>& files, const std::vector<FileResult>& results,
                              const std::string& destination_root);

    /**
     * Render the plain-text report. When output_path is non-empty the text is
     * also written there; a write failure is logged and the text still returned.
     */
    std::string GenerateReport(const ValidationResult& result, const std::string& output_path = "");

private:
    LogCallback log_callback_;

    static void CheckFile(const std::string& source_path, const std::string& path, uint64_t expected_size,
                          ValidationResult& result);
    static void CheckExpected(const MediaFile& file, const std::string& destination_root, ValidationResult& result);
    static void CheckWritten(const FileResult& r, ValidationResult& result);
    void Log(const std::string& message);
};

} // namespace offload
