#include "ScanWorker.h"

#include <stdexcept>

namespace offload {

ScanWorker::ScanWorker(Scanner& scanner, std::chrono::seconds cache_timeout, LogCallback log_callback)
    : scanner_(scanner), cache_timeout_(cache_timeout), log_callback_(log_callback),
      running_(false), cancel_(false) {
}

ScanWorker::~ScanWorker() {
    Stop();
}

void ScanWorker::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_(message);
    }
}

void ScanWorker::Start(std::shared_ptr<SourceDevice> device, CompletionCallback on_complete, bool use_cache) {
    if (!device) {
        throw std::invalid_argument("ScanWorker::Start requires a device");
    }
    if (scan_thread_.joinable() && scan_thread_.get_id() == std::this_thread::get_id()) {
        throw std::logic_error("ScanWorker::Start called from its own completion callback");
    }

    const std::string device_id = device->Id();
    if (running_) {
        Log("Superseding scan of " + CurrentDeviceId() + " with new scan of " + device_id);
    }
    Stop();

    if (use_cache) {
        ScanResult cached;
        if (GetCached(device_id, cached)) {
            Log("Using cached scan of " + device_id + " (" + std::to_string(cached.files.size()) + " files)");
            if (on_complete) on_complete(device_id, cached);
            return;
        }
    } else {
        ClearCache(device_id);
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        current_device_id_ = device_id;
    }
    cancel_ = false;
    running_ = true;
    scan_thread_ = std::thread(&ScanWorker::Run, this, device, on_complete);
}

void ScanWorker::Run(std::shared_ptr<SourceDevice> device, CompletionCallback on_complete) {
    ScanResult result;
    try {
        result = scanner_.Scan(*device, &cancel_);
    } catch (const std::exception& e) {
        result = ScanResult();
        result.error = "Scan failed: " + std::string(e.what());
        Log("Error: " + result.error);
    }

    if (result.cancelled) {
        Log("Scan of " + device->Id() + " was superseded");
        running_ = false;
        return;
    }

    if (result.success) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        cache_[device->Id()] = {result, std::chrono::steady_clock::now()};
    }

    running_ = false;
    if (on_complete) {
        on_complete(device->Id(), result);
    }
}

void ScanWorker::Stop() {
    cancel_ = true;
    if (scan_thread_.joinable()) {
        scan_thread_.join();
    }
    running_ = false;
}

void ScanWorker::Wait() {
    if (scan_thread_.joinable()) {
        scan_thread_.join();
    }
}

std::string ScanWorker::CurrentDeviceId() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return current_device_id_;
}

bool ScanWorker::GetCached(const std::string& device_id, ScanResult& result) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = cache_.find(device_id);
    if (it == cache_.end()) {
        return false;
    }
    if (std::chrono::steady_clock::now() - it->second.stored_at > cache_timeout_) {
        return false;
    }
    result = it->second.result;
    return true;
}

void ScanWorker::SetCacheTimeout(std::chrono::seconds cache_timeout) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    cache_timeout_ = cache_timeout;
}

void ScanWorker::ClearCache(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (device_id.empty()) {
        cache_.clear();
    } else {
        cache_.erase(device_id);
    }
}

} // namespace offload
