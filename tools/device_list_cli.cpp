/**
 * Device List CLI - Lists removable drives and MTP devices, optionally watching for changes
 *
 * Usage:
 *   device_list_cli [--watch] [--no-mtp]
 */

#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "lib/src/device/DeviceMonitor.h"
#include "lib/src/device/MtpDevice.h"

using namespace offload;

static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int signal) {
    (void)signal;
    g_running = 0;
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

void print_device(const char* prefix, const DeviceRecord& record) {
    std::cout << prefix << " [" << DeviceKindToString(record.kind) << "] " << record.display_name << std::endl;
    std::cout << "    Id:       " << record.id << std::endl;
    if (record.capacity_bytes > 0) {
        std::cout << "    Capacity: " << format_bytes(record.capacity_bytes)
                  << " (" << format_bytes(record.free_bytes) << " free)" << std::endl;
    }
}

int main(int argc, char* argv[]) {
    bool watch = false;
    bool include_mtp = true;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--watch") watch = true;
        else if (arg == "--no-mtp") include_mtp = false;
        else {
            std::cout << "Usage: " << argv[0] << " [--watch] [--no-mtp]" << std::endl;
            return arg == "--help" ? 0 : 1;
        }
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    auto log = [](const std::string& message) { std::cerr << message << std::endl; };

    DeviceMonitor monitor(log);
    monitor.AddEnumerator(std::make_unique<MountEnumerator>());
    if (include_mtp) {
        monitor.AddEnumerator(std::make_unique<MtpEnumerator>(log));
    }

    auto on_added = [](const DeviceRecord& record) { print_device("+", record); };
    auto on_removed = [](const std::string& device_id) { std::cout << "- " << device_id << std::endl; };

    std::cout << "=== Media Sources ===" << std::endl << std::endl;
    monitor.PollOnce(on_added, on_removed);
    if (monitor.GetDevices().empty()) {
        std::cout << "(no devices)" << std::endl;
    }

    if (!watch) {
        return 0;
    }

    std::cout << std::endl << "Watching for changes (Ctrl+C to stop)..." << std::endl;
    monitor.StartBackground(on_added, on_removed);
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    monitor.Stop();
    return 0;
}
