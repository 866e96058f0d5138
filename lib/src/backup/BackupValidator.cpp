#include "BackupValidator.h"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>

#include "Deduplicator.h"

namespace fs = std::filesystem;

namespace offload {

BackupValidator::BackupValidator(LogCallback log_callback)
    : log_callback_(log_callback) {
}

void BackupValidator::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_(message);
    }
}

void BackupValidator::CheckFile(const std::string& source_path, const std::string& path, uint64_t expected_size,
                                ValidationResult& result) {
    result.total_checked++;
    try {
        if (!fs::exists(path)) {
            result.missing++;
            result.failed_files.push_back({source_path, "Not found at " + path});
            return;
        }
        uint64_t actual = fs::file_size(path);
        if (actual != expected_size) {
            result.size_mismatch++;
            result.failed_files.push_back({source_path, "Size mismatch: expected " +
                std::to_string(expected_size) + " bytes, found " + std::to_string(actual)});
            return;
        }
        result.successful++;
    } catch (const std::exception& e) {
        result.failed++;
        result.failed_files.push_back({source_path, e.what()});
    }
}

void BackupValidator::CheckExpected(const MediaFile& file, const std::string& destination_root,
                                    ValidationResult& result) {
    std::string expected;
    try {
        expected = Deduplicator::ExpectedPath(file, destination_root);
    } catch (const std::exception& e) {
        result.total_checked++;
        result.failed++;
        result.failed_files.push_back({file.source.path, e.what()});
        return;
    }
    CheckFile(file.source.path, expected, file.size_bytes, result);
}

void BackupValidator::CheckWritten(const FileResult& r, ValidationResult& result) {
    if (r.outcome.status == CopyStatus::Failed) {
        result.total_checked++;
        result.failed++;
        result.failed_files.push_back({r.file.source.path, r.outcome.reason});
        return;
    }
    CheckFile(r.file.source.path, r.outcome.destination_path, r.file.size_bytes, result);
}

ValidationResult BackupValidator::Validate(const std::vector<MediaFile>& files, const std::string& destination_root) {
    ValidationResult result;
    for (const auto& file : files) {
        CheckExpected(file, destination_root, result);
    }

    Log("Validation: " + std::to_string(result.successful) + "/" + std::to_string(result.total_checked) +
        " files verified");
    return result;
}

ValidationResult BackupValidator::Validate(const std::vector<FileResult>& results) {
    ValidationResult result;
    for (const auto& r : results) {
        CheckWritten(r, result);
    }
    return result;
}

ValidationResult BackupValidator::Validate(const std::vector<MediaFile>& files, const std::vector<FileResult>& results,
                                           const std::string& destination_root) {
    std::map<std::string, const FileResult*> written;
    for (const auto& r : results) {
        written[r.file.source.path] = &r;
    }

    ValidationResult result;
    for (const auto& file : files) {
        auto it = written.find(file.source.path);
        if (it != written.end()) {
            CheckWritten(*it->second, result);
        } else {
            CheckExpected(file, destination_root, result);
        }
    }

    Log("Validation: " + std::to_string(result.successful) + "/" + std::to_string(result.total_checked) +
        " files verified");
    return result;
}

std::string BackupValidator::GenerateReport(const ValidationResult& result, const std::string& output_path) {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    std::ostringstream report;
    report << "=== Backup Validation Report ===\n";
    report << "Generated at: " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "\n\n";
    report << "Total files checked: " << result.total_checked << "\n";
    report << "Successfully backed up: " << result.successful << "\n";
    report << "Files missing: " << result.missing << "\n";
    report << "Size mismatch: " << result.size_mismatch << "\n";
    report << "Other errors: " << result.failed << "\n";

    if (!result.failed_files.empty()) {
        report << "\n=== Failed File Details ===\n";
        for (const auto& failure : result.failed_files) {
            report << "File: " << failure.file << "\n";
            report << "Error: " << failure.error << "\n\n";
        }
    }

    std::string text = report.str();
    if (!output_path.empty()) {
        std::ofstream out(output_path);
        if (!out.is_open()) {
            Log("Error: Could not write validation report to " + output_path);
        } else {
            out << text;
            Log("Validation report written to " + output_path);
        }
    }
    return text;
}

} // namespace offload
