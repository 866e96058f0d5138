#include "SessionLog.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace offload {

static const char* const LOG_FILE_PREFIX = "backup_";
static const char* const LOG_FILE_SUFFIX = ".log";

static std::tm LocalNow(int* millis) {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    if (millis) {
        *millis = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000);
    }
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

SessionLog::~SessionLog() {
    Close();
}

bool SessionLog::Open(const std::string& log_dir, int max_files) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }

    std::error_code ec;
    fs::create_directories(log_dir, ec);
    if (ec) {
        std::cerr << "SessionLog: Failed to create log directory " << log_dir << ": " << ec.message() << std::endl;
        return false;
    }

    RemoveOldLogs(log_dir, max_files > 0 ? max_files - 1 : 0);

    std::tm tm = LocalNow(nullptr);
    std::ostringstream name;
    name << LOG_FILE_PREFIX << std::put_time(&tm, "%Y%m%d_%H%M%S") << LOG_FILE_SUFFIX;
    file_path_ = (fs::path(log_dir) / name.str()).string();

    file_.open(file_path_, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "SessionLog: Failed to open log file: " << file_path_ << std::endl;
        return false;
    }
    return true;
}

void SessionLog::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

bool SessionLog::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

std::string SessionLog::FormatLine(LogLevel level, const std::string& message) {
    int millis = 0;
    std::tm tm = LocalNow(&millis);
    std::ostringstream line;
    line << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << ","
         << std::setw(3) << std::setfill('0') << millis
         << " - " << LogLevelToString(level) << " - " << message;
    return line.str();
}

LogLevel SessionLog::LevelFromMessage(const std::string& message) {
    // Skip indentation used for nested progress lines
    size_t start = message.find_first_not_of(' ');
    if (start == std::string::npos) {
        return LogLevel::INFO;
    }
    // Component tags such as "[ConfigLoader] " come before the level word
    if (message[start] == '[') {
        size_t close = message.find("] ", start);
        if (close != std::string::npos) {
            start = message.find_first_not_of(' ', close + 1);
            if (start == std::string::npos) {
                return LogLevel::INFO;
            }
        }
    }
    if (message.compare(start, 5, "Error") == 0) return LogLevel::ERROR;
    if (message.compare(start, 7, "Warning") == 0) return LogLevel::WARNING;
    return LogLevel::INFO;
}

void SessionLog::Write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    file_ << FormatLine(level, message) << std::endl;
}

LogCallback SessionLog::Callback(LogCallback next) {
    return [this, next](const std::string& message) {
        Write(LevelFromMessage(message), message);
        if (next) {
            next(message);
        }
    };
}

void SessionLog::RemoveOldLogs(const std::string& log_dir, int keep) {
    std::vector<fs::path> logs;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(log_dir, ec)) {
        std::string name = entry.path().filename().string();
        if (entry.is_regular_file(ec) && name.rfind(LOG_FILE_PREFIX, 0) == 0 &&
            name.size() > 4 && name.compare(name.size() - 4, 4, LOG_FILE_SUFFIX) == 0) {
            logs.push_back(entry.path());
        }
    }
    if (static_cast<int>(logs.size()) <= keep) {
        return;
    }

    // Timestamped names sort chronologically
    std::sort(logs.begin(), logs.end());
    size_t excess = logs.size() - static_cast<size_t>(keep);
    for (size_t i = 0; i < excess; ++i) {
        fs::remove(logs[i], ec);
        if (ec) {
            std::cerr << "SessionLog: Failed to remove old log " << logs[i] << ": " << ec.message() << std::endl;
        }
    }
}

} // namespace offload
