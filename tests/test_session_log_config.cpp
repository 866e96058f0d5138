/**
 * test_session_log_config.cpp
 *
 * Unit tests for SessionLog (file naming, line format, rotation) and the
 * settings.json loader.
 */

#include "lib/src/OffloadConfig.h"
#include "lib/src/SessionLog.h"
#include "tests/TestSupport.h"

#include <regex>
#include <sstream>

using namespace offload;
namespace fs = std::filesystem;

static std::vector<std::string> LogFiles(const std::string& dir) {
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) {
        std::string name = entry.path().filename().string();
        if (name.rfind("backup_", 0) == 0) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool TestLogFileAndLineFormat() {
    std::cout << "Testing log file name and line format..." << std::endl;

    TempDir dir("log");
    SessionLog log;
    ASSERT_TRUE(log.Open(dir / "nested/logs", 20), "Open creates the directory");
    ASSERT_TRUE(log.IsOpen(), "Log is open");

    std::string name = fs::path(log.FilePath()).filename().string();
    ASSERT_TRUE(std::regex_match(name, std::regex(R"(backup_\d{8}_\d{6}\.log)")), "File name pattern");

    log.Write(LogLevel::INFO, "Starting backup");
    LogCallback callback = log.Callback();
    callback("Warning: Could not remove partial file");
    callback("  Error: nested failure");
    log.Close();

    std::string text = ReadFile(log.FilePath());
    std::regex line(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2},\d{3} - (INFO|WARNING|ERROR) - .*)");
    std::istringstream lines(text);
    std::string current;
    int count = 0;
    while (std::getline(lines, current)) {
        ASSERT_TRUE(std::regex_match(current, line), "Line format: " + current);
        count++;
    }
    ASSERT_EQ(count, 3, "Three lines written");
    ASSERT_TRUE(text.find(" - INFO - Starting backup") != std::string::npos, "Info line");
    ASSERT_TRUE(text.find(" - WARNING - Warning: Could not") != std::string::npos, "Warning level from prefix");
    ASSERT_TRUE(text.find(" - ERROR -   Error: nested") != std::string::npos, "Indented error detected");

    // Closed log ignores further writes
    log.Write(LogLevel::INFO, "after close");
    ASSERT_TRUE(ReadFile(log.FilePath()).find("after close") == std::string::npos, "No write after Close");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestLevelFromMessage() {
    std::cout << "Testing level detection..." << std::endl;

    ASSERT_TRUE(SessionLog::LevelFromMessage("Error: disk full") == LogLevel::ERROR, "Error prefix");
    ASSERT_TRUE(SessionLog::LevelFromMessage("Warning: retrying") == LogLevel::WARNING, "Warning prefix");
    ASSERT_TRUE(SessionLog::LevelFromMessage("Copying a -> b") == LogLevel::INFO, "Plain message");
    ASSERT_TRUE(SessionLog::LevelFromMessage("") == LogLevel::INFO, "Empty message");
    ASSERT_TRUE(SessionLog::LevelFromMessage("No Error here") == LogLevel::INFO, "Only a leading prefix counts");
    ASSERT_TRUE(SessionLog::LevelFromMessage("[ConfigLoader] Error reading /x.json: parse") == LogLevel::ERROR,
                "Level word after a component tag");
    ASSERT_TRUE(SessionLog::LevelFromMessage("[MtpDevice] Warning: slow") == LogLevel::WARNING, "Tagged warning");
    ASSERT_TRUE(SessionLog::LevelFromMessage("[ConfigLoader] Loaded") == LogLevel::INFO, "Tagged info");
    ASSERT_TRUE(SessionLog::LevelFromMessage("[unterminated Error") == LogLevel::INFO, "Tag needs a closing bracket");
    ASSERT_TRUE(SessionLog::LevelFromMessage("Warning: Backup interrupted: Source disconnected") == LogLevel::WARNING,
                "Interrupted backup logged as a warning");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestLogRotation() {
    std::cout << "Testing old log removal..." << std::endl;

    TempDir dir("log_rotate");
    for (int i = 1; i <= 5; ++i) {
        WriteFile(dir / ("backup_2020010" + std::to_string(i) + "_000000.log"), "old");
    }
    WriteFile(dir / "readme.txt", "keep");

    SessionLog log;
    ASSERT_TRUE(log.Open(dir.Path(), 3), "Open succeeds");
    log.Close();

    std::vector<std::string> names = LogFiles(dir.Path());
    ASSERT_EQ(names.size(), static_cast<size_t>(3), "Max file count kept including the new log");
    ASSERT_EQ(names[0], std::string("backup_20200104_000000.log"), "Oldest logs removed first");
    ASSERT_EQ(names[1], std::string("backup_20200105_000000.log"), "Newest old log kept");
    ASSERT_TRUE(fs::exists(dir / "readme.txt"), "Unrelated files untouched");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestConfigDefaultsAndOverrides() {
    std::cout << "Testing settings.json overrides..." << std::endl;

    OffloadConfig defaults;
    ASSERT_EQ(defaults.hash_chunk_bytes, static_cast<size_t>(8192), "Default hash chunk");
    ASSERT_EQ(defaults.duplicate_time_tolerance_seconds, 2, "Default tolerance");
    ASSERT_EQ(defaults.collision_attempt_limit, 1000, "Default collision limit");
    ASSERT_EQ(defaults.transfer_wait_seconds, 10, "Default transfer wait");
    ASSERT_EQ(defaults.max_log_files, 20, "Default log count");
    ASSERT_TRUE(defaults.EffectiveLogDir().find("MediaOffloadLogs") != std::string::npos, "Default log directory");

    TempDir dir("config");
    WriteFile(dir / "settings.json", R"({
        "log_dir": "/var/log/offload",
        "collision_attempt_limit": 50,
        "duplicate_time_tolerance_seconds": 5,
        "unknown_key": [1, 2, 3]
    })");

    OffloadConfig config;
    std::vector<std::string> logs;
    ASSERT_TRUE(ConfigLoader::Load(dir / "settings.json", config,
                                   [&](const std::string& msg) { logs.push_back(msg); }), "Load succeeds");
    ASSERT_EQ(config.log_dir, std::string("/var/log/offload"), "String override");
    ASSERT_EQ(config.EffectiveLogDir(), std::string("/var/log/offload"), "Configured directory used");
    ASSERT_EQ(config.collision_attempt_limit, 50, "Integer override");
    ASSERT_EQ(config.duplicate_time_tolerance_seconds, 5, "Tolerance override");
    ASSERT_EQ(config.copy_buffer_bytes, defaults.copy_buffer_bytes, "Absent key keeps the default");
    ASSERT_TRUE(logs.empty(), "Unknown keys ignored silently");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestConfigRejectsBadFiles() {
    std::cout << "Testing malformed and invalid settings..." << std::endl;

    TempDir dir("config");
    OffloadConfig config;
    config.collision_attempt_limit = 7;

    ASSERT_FALSE(ConfigLoader::Load(dir / "absent.json", config), "Missing file reported");

    WriteFile(dir / "broken.json", "{ \"collision_attempt_limit\": ");
    std::vector<std::string> logs;
    ASSERT_FALSE(ConfigLoader::Load(dir / "broken.json", config,
                                    [&](const std::string& msg) { logs.push_back(msg); }), "Parse error reported");
    ASSERT_EQ(config.collision_attempt_limit, 7, "Config untouched after parse error");
    ASSERT_FALSE(logs.empty(), "Parse error logged");

    TempDir log_dir("config_log");
    SessionLog session_log;
    ASSERT_TRUE(session_log.Open(log_dir.Path(), 5), "Session log opened");
    ASSERT_FALSE(ConfigLoader::Load(dir / "broken.json", config, session_log.Callback()), "Parse error via session log");
    session_log.Close();
    ASSERT_TRUE(ReadFile(session_log.FilePath()).find(" - ERROR - [ConfigLoader] Error reading") != std::string::npos,
                "Config read failure recorded at error level");

    WriteFile(dir / "invalid.json", R"({"max_log_files": 3, "copy_buffer_bytes": 0})");
    ASSERT_FALSE(ConfigLoader::Load(dir / "invalid.json", config), "Zero buffer rejected");
    ASSERT_EQ(config.max_log_files, 20, "No partial override from a rejected file");

    WriteFile(dir / "wrongtype.json", R"({"collision_attempt_limit": "many"})");
    ASSERT_FALSE(ConfigLoader::Load(dir / "wrongtype.json", config), "Wrong value type rejected");
    ASSERT_EQ(config.collision_attempt_limit, 7, "Config untouched after type error");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestConfigSaveAndReload() {
    std::cout << "Testing settings save and reload..." << std::endl;

    TempDir dir("config");
    OffloadConfig original;
    original.temp_dir = "/tmp/offload";
    original.transfer_poll_ms = 50;
    original.scan_cache_seconds = 60;
    ASSERT_TRUE(ConfigLoader::Save(dir / "settings.json", original), "Save succeeds");

    OffloadConfig loaded;
    ASSERT_TRUE(ConfigLoader::Load(dir / "settings.json", loaded), "Reload succeeds");
    ASSERT_EQ(loaded.temp_dir, std::string("/tmp/offload"), "Temp dir kept");
    ASSERT_EQ(loaded.transfer_poll_ms, 50, "Poll interval kept");
    ASSERT_EQ(loaded.scan_cache_seconds, 60, "Cache lifetime kept");

    ASSERT_FALSE(ConfigLoader::Save(dir / "missing/dir/settings.json", original), "Unwritable path reported");

    std::cout << "  PASS" << std::endl;
    return true;
}

int main() {
    std::cout << "======================================" << std::endl;
    std::cout << " SessionLog / Config Unit Tests" << std::endl;
    std::cout << "======================================" << std::endl << std::endl;

    int passed = 0;
    int total = 0;

    auto run_test = [&](bool (*test_func)(), const std::string& name) {
        total++;
        if (test_func()) {
            passed++;
        } else {
            std::cout << "  TEST FAILED: " << name << std::endl;
        }
        std::cout << std::endl;
    };

    run_test(TestLogFileAndLineFormat, "Log File And Line Format");
    run_test(TestLevelFromMessage, "Level From Message");
    run_test(TestLogRotation, "Log Rotation");
    run_test(TestConfigDefaultsAndOverrides, "Config Overrides");
    run_test(TestConfigRejectsBadFiles, "Config Rejects Bad Files");
    run_test(TestConfigSaveAndReload, "Config Save And Reload");

    std::cout << "======================================" << std::endl;
    std::cout << " Test Results: " << passed << "/" << total << " passed" << std::endl;
    std::cout << "======================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
