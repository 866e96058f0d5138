#pragma once

#include <fstream>
#include <mutex>
#include <string>

#include "OffloadTypes.h"

namespace offload {

enum class LogLevel : uint8_t {
    INFO = 0,
    WARNING = 1,
    ERROR = 2,
};

inline std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

/**
 * SessionLog
 *
 * One append-only text file per session:
 *   <log_dir>/backup_YYYYMMDD_HHMMSS.log
 * with lines
 *   YYYY-MM-DD HH:MM:SS,mmm - LEVEL - message
 *
 * Components keep logging through a plain LogCallback; Callback() adapts
 * messages to this file, taking the level from an "Error"/"Warning" prefix.
 * Every line is flushed so the file survives a crash or a pulled drive.
 */
class SessionLog {
public:
    SessionLog() = default;
    ~SessionLog();

    SessionLog(const SessionLog&) = delete;
    SessionLog& operator=(const SessionLog&) = delete;

    /**
     * Create the directory if needed, open a new timestamped file and remove
     * the oldest session logs beyond max_files.
     *
     * @return false if the file could not be opened (logging becomes a no-op)
     */
    bool Open(const std::string& log_dir, int max_files);
    void Close();
    bool IsOpen() const;

    void Write(LogLevel level, const std::string& message);

    // Adapter for components; also forwards each message to next when set
    LogCallback Callback(LogCallback next = nullptr);

    const std::string& FilePath() const { return file_path_; }

    static LogLevel LevelFromMessage(const std::string& message);
    static std::string FormatLine(LogLevel level, const std::string& message);

private:
    std::ofstream file_;
    std::string file_path_;
    mutable std::mutex mutex_;

    static void RemoveOldLogs(const std::string& log_dir, int keep);
};

} // namespace offload
