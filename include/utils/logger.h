#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstdint>

namespace stakerep {
namespace utils {

struct StorageConfig;

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string category;
    uint64_t timestamp;
};

class Logger {
public:
    static void init(const std::string& path);
    // Opens storage.log_path (when set) and applies storage.log_level.
    static void init(const StorageConfig& storage);
    static void shutdown();
    static bool isInitialized();

    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static void enableConsole(bool enable);

    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void log(LogLevel level, const std::string& category, const std::string& msg);

    static void onLog(std::function<void(const LogEntry&)> callback);
    static std::vector<LogEntry> getRecentLogs(size_t count = 100);
    static uint64_t getErrorCount();
    static void clearLogs();

    // Raw credentials carry full certificate subjects; log a short form unless
    // STAKEREP_ALLOW_SENSITIVE_LOGS is set when the log file is opened.
    static std::string redactCredential(const std::string& credential);
};

LogLevel parseLogLevel(const std::string& name, LogLevel def = LogLevel::INFO);
const char* logLevelName(LogLevel level);

#define LOG_DEBUG(msg) do { if (stakerep::utils::Logger::getLevel() <= stakerep::utils::LogLevel::DEBUG) stakerep::utils::Logger::debug(msg); } while(0)
#define LOG_INFO(msg) stakerep::utils::Logger::info(msg)
#define LOG_WARN(msg) stakerep::utils::Logger::warn(msg)
#define LOG_ERROR(msg) stakerep::utils::Logger::error(msg)
#define LOG_CAT(level, cat, msg) stakerep::utils::Logger::log(level, cat, msg)

}
}
