#include "utils/logger.h"
#include "utils/utils.h"
#include <fstream>
#include <ctime>
#include <iostream>
#include <mutex>
#include <atomic>
#include <cstdlib>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <deque>
#include <cstddef>

namespace coursedao {
namespace utils {

namespace {

const size_t MAX_RECENT_LOGS = 1000;

struct LogSink {
    std::mutex mtx;
    std::ofstream file;
    std::string path;
    uint64_t maxFileSize = 10 * 1024 * 1024;
    uint32_t maxFiles = 5;
    std::deque<LogEntry> recent;
    uint64_t count = 0;
    uint64_t errors = 0;
    std::function<void(const LogEntry&)> callback;
};

LogSink& sink() {
    static LogSink s;
    return s;
}

std::atomic<LogLevel> currentLevel{LogLevel::INFO};
std::atomic<bool> consoleEnabled{true};
std::atomic<bool> allowSensitive{false};

const char* levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

// path -> path.1 -> ... -> path.<maxFiles-1>, oldest dropped. Caller holds the lock.
void rotateLocked(LogSink& s) {
    if (s.path.empty()) return;
    if (s.file.is_open()) s.file.close();

    std::error_code ec;
    for (int i = static_cast<int>(s.maxFiles) - 1; i >= 1; i--) {
        std::string older = s.path + "." + std::to_string(i);
        if (!std::filesystem::exists(older, ec)) continue;
        if (i == static_cast<int>(s.maxFiles) - 1) {
            std::filesystem::remove(older, ec);
        } else {
            std::filesystem::rename(older, s.path + "." + std::to_string(i + 1), ec);
        }
    }
    if (std::filesystem::exists(s.path, ec)) {
        std::filesystem::rename(s.path, s.path + ".1", ec);
    }
    s.file.open(s.path, std::ios::app);
}

void emit(LogLevel level, const std::string& category, const std::string& msg) {
    if (level < currentLevel.load()) return;

    time_t now = std::time(nullptr);
    std::tm tmBuf{};
    localtime_r(&now, &tmBuf);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tmBuf);

    std::ostringstream oss;
    oss << stamp << " [" << levelTag(level) << "]";
    if (!category.empty()) oss << " [" << category << "]";
    oss << " " << msg << "\n";
    const std::string line = oss.str();

    LogEntry entry{level, category, msg, static_cast<uint64_t>(now)};
    std::function<void(const LogEntry&)> callback;
    {
        LogSink& s = sink();
        std::lock_guard<std::mutex> lock(s.mtx);
        if (consoleEnabled) {
            if (level >= LogLevel::ERROR) {
                std::cerr << line;
            } else {
                std::clog << line;
            }
        }
        if (s.file.is_open()) {
            s.file << line;
            s.file.flush();
            if (s.file.tellp() > static_cast<std::streampos>(s.maxFileSize)) rotateLocked(s);
        }

        s.count++;
        if (level >= LogLevel::ERROR) s.errors++;
        s.recent.push_back(entry);
        while (s.recent.size() > MAX_RECENT_LOGS) s.recent.pop_front();
        callback = s.callback;
    }
    if (callback) callback(entry);
}

}

void Logger::init(const std::string& path) {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.file.is_open()) s.file.close();
    s.path = path;

    std::error_code ec;
    std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
    s.file.open(path, std::ios::app);

    const char* env = std::getenv("COURSEDAO_ALLOW_SENSITIVE_LOGS");
    if (env && (std::string(env) == "1" || std::string(env) == "true")) allowSensitive = true;
}

void Logger::shutdown() {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.file.is_open()) {
        s.file.flush();
        s.file.close();
    }
}

void Logger::setLevel(LogLevel level) {
    currentLevel = level;
}

LogLevel Logger::getLevel() {
    return currentLevel;
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
    std::string s = Formatter::toLower(name);
    if (s == "trace") out = LogLevel::TRACE;
    else if (s == "debug") out = LogLevel::DEBUG;
    else if (s == "info") out = LogLevel::INFO;
    else if (s == "warn" || s == "warning") out = LogLevel::WARN;
    else if (s == "error") out = LogLevel::ERROR;
    else if (s == "fatal") out = LogLevel::FATAL;
    else if (s == "off" || s == "none") out = LogLevel::OFF;
    else return false;
    return true;
}

void Logger::enableConsole(bool enable) {
    consoleEnabled = enable;
}

void Logger::setMaxFileSize(uint64_t bytes) {
    std::lock_guard<std::mutex> lock(sink().mtx);
    sink().maxFileSize = bytes;
}

void Logger::setMaxFiles(uint32_t count) {
    std::lock_guard<std::mutex> lock(sink().mtx);
    sink().maxFiles = std::max<uint32_t>(count, 1);
}

void Logger::trace(const std::string& msg) { emit(LogLevel::TRACE, "", msg); }
void Logger::debug(const std::string& msg) { emit(LogLevel::DEBUG, "", msg); }
void Logger::info(const std::string& msg) { emit(LogLevel::INFO, "", msg); }
void Logger::warn(const std::string& msg) { emit(LogLevel::WARN, "", msg); }
void Logger::error(const std::string& msg) { emit(LogLevel::ERROR, "", msg); }

void Logger::log(LogLevel level, const std::string& msg) {
    emit(level, "", msg);
}

void Logger::log(LogLevel level, const std::string& category, const std::string& msg) {
    emit(level, category, msg);
}

void Logger::onLog(std::function<void(const LogEntry&)> callback) {
    std::lock_guard<std::mutex> lock(sink().mtx);
    sink().callback = std::move(callback);
}

std::vector<LogEntry> Logger::getRecentLogs(size_t count) {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    size_t start = s.recent.size() > count ? s.recent.size() - count : 0;
    return std::vector<LogEntry>(s.recent.begin() + static_cast<std::ptrdiff_t>(start), s.recent.end());
}

uint64_t Logger::getLogCount() {
    std::lock_guard<std::mutex> lock(sink().mtx);
    return sink().count;
}

uint64_t Logger::getErrorCount() {
    std::lock_guard<std::mutex> lock(sink().mtx);
    return sink().errors;
}

void Logger::clearLogs() {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.recent.clear();
    s.count = 0;
    s.errors = 0;
}

void Logger::setAllowSensitiveLogging(bool allow) {
    allowSensitive = allow;
}

std::string Logger::redactAddress(const std::string& address) {
    if (!allowSensitive && address.length() > 12) {
        return address.substr(0, 6) + "..." + address.substr(address.length() - 4);
    }
    return address;
}

}
}
