#include "utils/logger.h"
#include "utils/config.h"
#include <fstream>
#include <ctime>
#include <iostream>
#include <mutex>
#include <atomic>
#include <cstdlib>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <deque>

namespace stakerep {
namespace utils {

static const uint64_t MAX_LOG_FILE_SIZE = 10 * 1024 * 1024;
static const int MAX_LOG_FILES = 5;
static const size_t MAX_RECENT_LOGS = 1000;
static const size_t CREDENTIAL_PREVIEW = 24;

static std::atomic<LogLevel> currentLevel{LogLevel::INFO};
static std::atomic<bool> consoleEnabled{true};
static std::atomic<bool> allowSensitive{false};
static std::atomic<uint64_t> errorCount{0};

static std::mutex logMutex;
static std::ofstream logFile;
static std::string logPath;
static std::function<void(const LogEntry&)> logCallback;
static std::deque<LogEntry> recentLogs;

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "?";
}

// stakerep.log -> stakerep.log.1 -> ... -> stakerep.log.<MAX_LOG_FILES>
static void rotateLocked() {
    if (logPath.empty()) return;
    if (logFile.is_open()) logFile.close();

    std::error_code ec;
    std::filesystem::remove(logPath + "." + std::to_string(MAX_LOG_FILES), ec);
    for (int i = MAX_LOG_FILES - 1; i >= 1; i--) {
        std::string from = logPath + "." + std::to_string(i);
        if (std::filesystem::exists(from, ec)) {
            std::filesystem::rename(from, logPath + "." + std::to_string(i + 1), ec);
        }
    }
    if (std::filesystem::exists(logPath, ec)) {
        std::filesystem::rename(logPath, logPath + ".1", ec);
    }
    logFile.open(logPath, std::ios::app);
}

static void writeLog(LogLevel level, const std::string& category, const std::string& msg) {
    if (level < currentLevel.load() || level == LogLevel::OFF) return;

    std::function<void(const LogEntry&)> callback;
    LogEntry entry;
    {
        std::lock_guard<std::mutex> lock(logMutex);

        time_t now = std::time(nullptr);
        char timeBuf[32];
        std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%dT%H:%M:%S", std::gmtime(&now));

        std::ostringstream oss;
        oss << timeBuf << " " << logLevelName(level);
        if (!category.empty()) oss << " [" << category << "]";
        oss << " " << msg << "\n";
        std::string line = oss.str();

        if (consoleEnabled) {
            (level >= LogLevel::WARN ? std::cerr : std::clog) << line;
        }
        if (logFile.is_open()) {
            logFile << line;
            logFile.flush();
            if (logFile.tellp() > static_cast<std::streampos>(MAX_LOG_FILE_SIZE)) {
                rotateLocked();
            }
        }
        if (level >= LogLevel::ERROR) errorCount++;

        entry.level = level;
        entry.message = msg;
        entry.category = category;
        entry.timestamp = static_cast<uint64_t>(now);
        recentLogs.push_back(entry);
        if (recentLogs.size() > MAX_RECENT_LOGS) recentLogs.pop_front();
        callback = logCallback;
    }

    if (callback) callback(entry);
}

void Logger::init(const std::string& path) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) logFile.close();
    logPath = path;

    std::error_code ec;
    std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
    logFile.open(path, std::ios::app);

    const char* env = std::getenv("STAKEREP_ALLOW_SENSITIVE_LOGS");
    if (env && (std::string(env) == "1" || std::string(env) == "true")) allowSensitive = true;
}

void Logger::init(const StorageConfig& storage) {
    setLevel(parseLogLevel(storage.logLevel));
    if (!storage.logPath.empty()) init(storage.logPath);
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
        logFile.close();
    }
    logPath.clear();
}

bool Logger::isInitialized() {
    std::lock_guard<std::mutex> lock(logMutex);
    return logFile.is_open();
}

void Logger::setLevel(LogLevel level) {
    currentLevel = level;
}

LogLevel Logger::getLevel() {
    return currentLevel;
}

void Logger::enableConsole(bool enable) {
    consoleEnabled = enable;
}

void Logger::debug(const std::string& msg) { writeLog(LogLevel::DEBUG, "", msg); }
void Logger::info(const std::string& msg) { writeLog(LogLevel::INFO, "", msg); }
void Logger::warn(const std::string& msg) { writeLog(LogLevel::WARN, "", msg); }
void Logger::error(const std::string& msg) { writeLog(LogLevel::ERROR, "", msg); }

void Logger::log(LogLevel level, const std::string& category, const std::string& msg) {
    writeLog(level, category, msg);
}

void Logger::onLog(std::function<void(const LogEntry&)> callback) {
    std::lock_guard<std::mutex> lock(logMutex);
    logCallback = std::move(callback);
}

std::vector<LogEntry> Logger::getRecentLogs(size_t count) {
    std::lock_guard<std::mutex> lock(logMutex);
    size_t start = recentLogs.size() > count ? recentLogs.size() - count : 0;
    return std::vector<LogEntry>(recentLogs.begin() + static_cast<std::ptrdiff_t>(start), recentLogs.end());
}

uint64_t Logger::getErrorCount() {
    return errorCount;
}

void Logger::clearLogs() {
    std::lock_guard<std::mutex> lock(logMutex);
    recentLogs.clear();
    errorCount = 0;
}

std::string Logger::redactCredential(const std::string& credential) {
    if (allowSensitive || credential.length() <= CREDENTIAL_PREVIEW) return credential;

    // certificate subjects keep their CN, anything else keeps both ends
    std::string lower = credential;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    size_t cn = lower.find("cn=");
    if (cn != std::string::npos) {
        size_t end = credential.find_first_of(",/:", cn);
        return credential.substr(cn, end == std::string::npos ? std::string::npos : end - cn) + ",...";
    }
    return credential.substr(0, 12) + "..." + credential.substr(credential.length() - 8);
}

LogLevel parseLogLevel(const std::string& name, LogLevel def) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "trace") return LogLevel::TRACE;
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "info") return LogLevel::INFO;
    if (n == "warn" || n == "warning") return LogLevel::WARN;
    if (n == "error") return LogLevel::ERROR;
    if (n == "fatal") return LogLevel::FATAL;
    if (n == "off") return LogLevel::OFF;
    return def;
}

}
}
