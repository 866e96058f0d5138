/**
 * Media Offload CLI - Back up photos and videos from a card or MTP camera
 *
 * Scans the source, shows the inventory summary, copies new files into
 * Photos_YYYY/MM/DD, Raw_YYYY/MM/DD and Videos_YYYY/MM/DD under the
 * destination, then validates the result.
 *
 * Usage:
 *   media_offload_cli (--source <path> | --mtp [serial]) --dest <path> [options]
 *
 *   --config <file>   Load settings.json
 *   --report <file>   Write the validation report
 *   --dry-run         Scan only
 *   --no-log-file     Do not write a session log
 *   --verbose         Show library log messages
 *   --help            Show this help
 */

#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "lib/src/OffloadSession.h"

using namespace offload;

static volatile std::sig_atomic_t g_stop_requested = 0;
static bool g_verbose = false;

void signal_handler(int signal) {
    (void)signal;
    g_stop_requested = 1;
}

void log_callback(const std::string& message) {
    if (!g_verbose) return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::cout << "[" << std::put_time(std::localtime(&time), "%H:%M:%S")
              << "." << std::setfill('0') << std::setw(3) << ms.count() << "] "
              << message << std::endl;
}

std::string format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);
    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    return ss.str();
}

void print_usage(const char* prog) {
    std::cout << "Media Offload CLI - Back up photos and videos from a card or camera" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << prog << " (--source <path> | --mtp [serial]) --dest <path> [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <file>   Load settings.json" << std::endl;
    std::cout << "  --report <file>   Write the validation report" << std::endl;
    std::cout << "  --dry-run         Scan only" << std::endl;
    std::cout << "  --no-log-file     Do not write a session log" << std::endl;
    std::cout << "  --verbose         Show library log messages" << std::endl;
    std::cout << "  --help            Show this help" << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc < 2) { print_usage(argv[0]); return 1; }

    std::string source_path;
    std::string mtp_serial;
    bool use_mtp = false;
    std::string dest_path;
    std::string config_path;
    std::string report_path;
    bool dry_run = false;
    bool log_file = true;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help") { print_usage(argv[0]); return 0; }
        else if (arg == "--verbose") g_verbose = true;
        else if (arg == "--dry-run") dry_run = true;
        else if (arg == "--no-log-file") log_file = false;
        else if (arg == "--source" && i + 1 < argc) source_path = argv[++i];
        else if (arg == "--dest" && i + 1 < argc) dest_path = argv[++i];
        else if (arg == "--config" && i + 1 < argc) config_path = argv[++i];
        else if (arg == "--report" && i + 1 < argc) report_path = argv[++i];
        else if (arg == "--mtp") {
            use_mtp = true;
            if (i + 1 < argc && argv[i + 1][0] != '-') mtp_serial = argv[++i];
        } else {
            std::cerr << "ERROR: Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (source_path.empty() == !use_mtp) {
        std::cerr << "ERROR: Specify exactly one of --source or --mtp" << std::endl;
        return 1;
    }
    if (dest_path.empty() && !dry_run) {
        std::cerr << "ERROR: --dest is required" << std::endl;
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    OffloadSession session;
    session.SetLogCallback(log_callback);
    if (!config_path.empty() && !session.LoadConfig(config_path)) {
        std::cerr << "ERROR: Could not load configuration: " << config_path << std::endl;
        return 1;
    }
    if (log_file && session.OpenLogFile()) {
        std::cout << "Session log: " << session.LogFilePath() << std::endl;
    }

    // ── Open & Scan ──────────────────────────────────────────────────────

    DeviceRecord record;
    if (use_mtp) {
        record.id = "MTP:" + mtp_serial;
        record.kind = DeviceKind::PortableProtocolDevice;
    } else {
        record.id = source_path;
        record.display_name = source_path;
        record.kind = DeviceKind::Manual;
    }

    auto device = session.OpenDevice(record);
    if (!device) {
        std::cerr << "ERROR: Could not open source " << (use_mtp ? "MTP device" : source_path) << std::endl;
        return 1;
    }

    std::cout << "Scanning " << device->DisplayName() << "..." << std::endl;
    session.SetScanProgressCallback([](size_t files_found, uint64_t bytes_seen) {
        if (files_found % 100 == 0) {
            std::cout << "  " << files_found << " files, " << format_bytes(bytes_seen) << std::endl;
        }
    });

    ScanResult scan = session.Scan(device);
    if (!scan.success) {
        std::cerr << "ERROR: Scan failed: " << scan.error << std::endl;
        return 1;
    }

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Inventory" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "  Photos:  " << scan.summary.photos << std::endl;
    std::cout << "  Raw:     " << scan.summary.raw_files << std::endl;
    std::cout << "  Videos:  " << scan.summary.videos << std::endl;
    std::cout << "  Total:   " << scan.summary.total_files << " (" << format_bytes(scan.summary.total_size_bytes) << ")" << std::endl;
    if (!scan.skipped.empty()) {
        std::cout << "  Skipped: " << scan.skipped.size() << std::endl;
    }
    std::cout << std::endl;

    if (dry_run) {
        return 0;
    }

    // ── Backup ───────────────────────────────────────────────────────────

    BackupObserver observer;
    observer.on_progress = [](const ProgressUpdate& update) {
        std::cout << "\r  " << update.processed << "/" << update.total
                  << " (copied " << update.copied << ", skipped " << update.skipped << ")" << std::flush;
    };
    observer.on_completed = [](size_t copied, size_t skipped, const std::string& folder) {
        std::cout << std::endl << "Backup complete: " << copied << " copied, " << skipped << " skipped" << std::endl;
        std::cout << "  Latest folder: " << folder << std::endl;
    };
    observer.on_interrupted = [](InterruptReason reason, size_t copied, size_t total) {
        std::cout << std::endl << "Backup interrupted: " << InterruptReasonToString(reason)
                  << " (" << copied << "/" << total << " copied)" << std::endl;
    };
    observer.on_fatal = [](const std::string& message) {
        std::cerr << std::endl << "ERROR: " << message << std::endl;
    };
    session.SetBackupObserver(observer);

    if (!session.StartBackup(dest_path)) {
        std::cerr << "ERROR: Could not start backup" << std::endl;
        return 1;
    }

    bool stop_sent = false;
    while (session.IsBackupRunning()) {
        if (g_stop_requested && !stop_sent) {
            std::cout << std::endl << "Stopping after the current file..." << std::endl;
            session.StopBackup();
            stop_sent = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    session.WaitForBackup();

    BackupReport report = session.LastBackupReport();
    if (report.failed > 0) {
        std::cout << "  Failed: " << report.failed << std::endl;
        for (const auto& r : report.results) {
            if (r.outcome.status == CopyStatus::Failed) {
                std::cout << "    " << r.file.name << ": " << r.outcome.reason << std::endl;
            }
        }
    }

    // ── Validate ─────────────────────────────────────────────────────────

    if (report.state == BackupState::Completed) {
        ValidationResult validation = session.Validate(dest_path);
        std::cout << "Validation: " << validation.successful << "/" << validation.total_checked
                  << " files verified" << std::endl;
        if (!report_path.empty()) {
            session.WriteValidationReport(dest_path, report_path);
            std::cout << "Report: " << report_path << std::endl;
        }
    }

    switch (report.state) {
        case BackupState::Completed:   return report.failed > 0 ? 2 : 0;
        case BackupState::Interrupted: return 3;
        default:                       return 1;
    }
}
